#pragma once

#include "fragment_reader.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Writes the ordering as a manifest: fragments in reading order, each tagged
// with its upload-index and position.
bool write_ordered_manifest(
    const std::filesystem::path& out_path,
    const FragmentBatch& batch,
    const std::vector<Segment>& ordered,
    bool computed_order,
    std::string& error
);
