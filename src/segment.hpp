#pragma once

#include <cstddef>
#include <string>

// One extracted fragment. index and id together identify the upload it came from.
struct Segment {
    std::size_t index = 0;
    std::string id;
    std::string text;
};
