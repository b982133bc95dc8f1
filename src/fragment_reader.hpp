#pragma once

#include "segment.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct FragmentBatch {
    std::filesystem::path source_path;
    std::string name;
    std::vector<Segment> segments;
};

// Trims each line, drops blank lines and joins the rest with '\n'.
std::string normalize_extracted_text(const std::string& raw);

// <fragments><fragment name="...">text</fragment>...</fragments>, document order is upload order.
bool read_fragment_manifest(const std::filesystem::path& path, FragmentBatch& out_batch, std::string& error);

// One fragment per *.txt file, upload order is file-name order.
bool read_text_directory(const std::filesystem::path& dir, FragmentBatch& out_batch, std::string& error);

// A manifest file, a directory of manifests (one batch each, recursive) or a
// directory of text files (one batch). Anything under output_dir is skipped.
bool collect_fragment_batches(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<FragmentBatch>& out_batches,
    std::string& error
);
