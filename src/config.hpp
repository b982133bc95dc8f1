#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::string vectors_path;
    std::string vectors_format = "auto";
    std::size_t vector_limit = 0;
    std::string model_path;
    std::size_t workers = 0;
    int n_ctx = 512;
    int n_gpu_layers = -1;
    int n_threads = 8;
    bool emit_markdown = false;
    bool emit_xml = true;
    bool fallback_upload_order = false;
    bool show_progress = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);
