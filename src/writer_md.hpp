#pragma once

#include "fragment_reader.hpp"

#include <filesystem>
#include <string>
#include <vector>

bool write_markdown_ordering(
    const std::filesystem::path& out_path,
    const FragmentBatch& batch,
    const std::vector<Segment>& ordered,
    bool computed_order,
    std::string& error
);
