#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    if (!value.empty() && value.front() == '-') {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <manifest-or-dir> --output <out-dir> (--vectors <word2vec> | --model <gguf>) [options]\n\n"
        << "Options:\n"
        << "  --vectors <path>          word2vec vectors (.bin is read as binary)\n"
        << "  --binary | --text         Force the word2vec file format\n"
        << "  --vector-limit <n>        Load at most n vectors (default: all)\n"
        << "  --model <path>            GGUF embedding model for llama.cpp\n"
        << "  --ctx <n>                 Context size (default: 512)\n"
        << "  --n-gpu-layers <n>        llama.cpp GPU layers (default: -1)\n"
        << "  --threads <n>             llama.cpp CPU threads per context (default: 8)\n"
        << "  --workers <n>             Batch worker threads (default: hardware concurrency)\n"
        << "  --emit-markdown           Also write Markdown output (*.order.md)\n"
        << "  --no-xml                  Do not write the ordered manifest (*.order.xml)\n"
        << "  --fallback-upload-order   Write upload order when no reading order can be computed\n"
        << "  --no-progress             Disable progress bar output\n"
        << "  -h, --help                Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_dir = require_value(arg);
        } else if (arg == "--vectors") {
            config.vectors_path = require_value(arg);
        } else if (arg == "--binary") {
            config.vectors_format = "binary";
        } else if (arg == "--text") {
            config.vectors_format = "text";
        } else if (arg == "--vector-limit") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_size_arg(arg, value, config.vector_limit, error)) {
                return false;
            }
        } else if (arg == "--model") {
            config.model_path = require_value(arg);
        } else if (arg == "--workers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_size_arg(arg, value, config.workers, error)) {
                return false;
            }
        } else if (arg == "--ctx") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_ctx, error)) {
                return false;
            }
        } else if (arg == "--n-gpu-layers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_gpu_layers, error)) {
                return false;
            }
        } else if (arg == "--threads") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.n_threads, error)) {
                return false;
            }
        } else if (arg == "--emit-markdown") {
            config.emit_markdown = true;
        } else if (arg == "--no-xml") {
            config.emit_xml = false;
        } else if (arg == "--fallback-upload-order") {
            config.fallback_upload_order = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.output_dir.empty()) {
        error = "--output is required";
        return false;
    }
    if (config.vectors_path.empty() == config.model_path.empty()) {
        error = "Exactly one of --vectors or --model is required";
        return false;
    }
    if (!config.model_path.empty() && config.vectors_format != "auto") {
        error = "--binary/--text only apply to --vectors";
        return false;
    }
    if (!config.emit_xml && !config.emit_markdown) {
        error = "--no-xml without --emit-markdown leaves nothing to write";
        return false;
    }

    return true;
}
