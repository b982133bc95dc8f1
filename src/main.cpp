#include "config.hpp"
#include "embedder_llama.hpp"
#include "fragment_reader.hpp"
#include "output_plan.hpp"
#include "pipeline.hpp"
#include "sequencer.hpp"
#include "wmd_oracle.hpp"
#include "word_vectors.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

WordVectorFormat vector_format_from(const std::string& name) {
    if (name == "binary") {
        return WordVectorFormat::Binary;
    }
    if (name == "text") {
        return WordVectorFormat::Text;
    }
    return WordVectorFormat::Auto;
}

std::unique_ptr<WordEmbedder> load_embedder(const AppConfig& config) {
    if (!config.vectors_path.empty()) {
        auto table = std::make_unique<WordVectorTable>(WordVectorTable::load_word2vec(
            config.vectors_path,
            vector_format_from(config.vectors_format),
            config.vector_limit
        ));
        std::cerr
            << "[model] loaded " << table->size() << " vectors (dim " << table->dimensions() << ") from "
            << config.vectors_path << "\n";
        return table;
    }

    LlamaEmbedderConfig embedder_cfg;
    embedder_cfg.model_path = config.model_path;
    embedder_cfg.n_ctx = config.n_ctx;
    embedder_cfg.n_gpu_layers = config.n_gpu_layers;
    embedder_cfg.n_threads = config.n_threads;

    auto embedder = std::make_unique<LlamaWordEmbedder>(embedder_cfg);
    std::cerr << "[model] loaded " << config.model_path << "\n";
    return embedder;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(std::size_t done_batches, std::size_t total_batches) {
    if (total_batches == 0) {
        return;
    }

    const double fraction = static_cast<double>(done_batches) / static_cast<double>(total_batches);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "batches " << done_batches << "/" << total_batches;

    std::cerr << line.str();
    if (done_batches >= total_batches) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    std::vector<FragmentBatch> batches;
    if (!collect_fragment_batches(config.input_path, config.output_dir, batches, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        std::cerr << "[fatal] cannot create output directory " << config.output_dir << ": " << ec.message() << "\n";
        return 1;
    }

    std::unique_ptr<DistanceOracle> oracle;
    try {
        oracle = std::make_unique<WordMoverOracle>(load_embedder(config));
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] failed to initialize distance oracle: " << ex.what() << "\n";
        return 1;
    }

    std::vector<BatchResult> results;
    PipelineStats stats;
    auto progress_callback = [&](std::size_t done, std::size_t total) {
        if (config.show_progress) {
            print_progress(done, total);
        }
    };

    if (!sequence_batches_parallel(batches, *oracle, config.workers, results, stats, error, progress_callback)) {
        std::cerr << "[fatal] sequencing aborted: " << error << "\n";
        return 1;
    }

    const bool input_is_dir = std::filesystem::is_directory(config.input_path, ec);
    std::size_t batches_ok = 0;
    std::size_t batches_failed = 0;
    std::size_t batches_empty = 0;

    for (std::size_t i = 0; i < batches.size(); ++i) {
        const auto& batch = batches[i];
        const auto& result = results[i];
        const auto plan = plan_batch_output(config, input_is_dir, batch, result);

        if (plan.outcome == BatchOutcome::Empty) {
            std::cout << "[skip] " << batch.name << " has no fragments, nothing to render\n";
            ++batches_empty;
            continue;
        }

        if (!result.ok) {
            std::cerr
                << "[error] " << batch.name << ": " << sequence_error_name(result.failure.kind)
                << " at step " << result.failure.step << ": " << result.failure.message << "\n";
        }
        if (plan.outcome == BatchOutcome::UploadOrder) {
            std::cerr << "[warn] " << batch.name << ": writing fragments in upload order\n";
        }

        if (!write_planned_outputs(config, batch, result, plan, error)) {
            std::cerr << "[error] write failed for " << batch.name << ": " << error << "\n";
            ++batches_failed;
            continue;
        }
        if (plan.outcome != BatchOutcome::Ordered) {
            ++batches_failed;
            continue;
        }

        ++batches_ok;

        std::cout
            << "[ok] " << batch.name
            << " fragments=" << result.stats.segments_total
            << " oracle_calls=" << result.stats.oracle_calls
            << " time_us=" << result.stats.wall_time.count()
            << " order=";
        for (std::size_t pos = 0; pos < result.ordered.size(); ++pos) {
            std::cout << (pos == 0 ? "" : ",") << result.ordered[pos].index;
        }
        std::cout << "\n";
    }

    std::cout
        << "[summary] batches=" << batches.size()
        << " ok=" << batches_ok
        << " failed=" << batches_failed
        << " empty=" << batches_empty
        << " workers=" << stats.workers_used
        << " oracle_calls=" << stats.oracle_calls
        << " total_time_ms=" << stats.wall_time.count()
        << "\n";

    return batches_failed == 0 ? 0 : 2;
}
