#include "pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

bool sequence_batches_parallel(
    const std::vector<FragmentBatch>& batches,
    const DistanceOracle& prototype,
    std::size_t workers,
    std::vector<BatchResult>& out_results,
    PipelineStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_stats = PipelineStats{};
    out_stats.batches_total = batches.size();
    out_results.clear();

    if (batches.empty()) {
        return true;
    }

    if (workers == 0) {
        workers = 1;
    }

    const std::size_t workers_used = std::min(workers, batches.size());
    out_stats.workers_used = workers_used;

    out_results.resize(batches.size());

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::stop_source stop_source;

    const auto started = std::chrono::steady_clock::now();

    std::jthread reporter;
    if (progress_callback) {
        reporter = std::jthread([&](std::stop_token stop_token) {
            std::size_t last_completed = std::numeric_limits<std::size_t>::max();
            while (!stop_token.stop_requested()) {
                const std::size_t done = completed.load(std::memory_order_relaxed);
                if (done != last_completed) {
                    progress_callback(done, batches.size());
                    last_completed = done;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            const std::size_t final_done = completed.load(std::memory_order_relaxed);
            if (final_done != last_completed) {
                progress_callback(final_done, batches.size());
            }
        });
    }

    auto record_fatal = [&](const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!failed.exchange(true, std::memory_order_relaxed)) {
            error = message;
        }
        stop_source.request_stop();
    };

    std::vector<std::jthread> pool;
    pool.reserve(workers_used);

    auto worker_fn = [&](std::stop_token stop_token) {
        std::unique_ptr<DistanceOracle> local_oracle;
        try {
            local_oracle = prototype.clone();
        } catch (const std::exception& ex) {
            record_fatal(std::string("Failed to clone distance oracle: ") + ex.what());
            return;
        }

        while (!stop_token.stop_requested() && !failed.load(std::memory_order_relaxed)) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= batches.size()) {
                return;
            }

            BatchResult& result = out_results[index];
            try {
                result.ok = sequence_segments(
                    batches[index].segments,
                    *local_oracle,
                    result.ordered,
                    result.failure,
                    &result.stats
                );
                completed.fetch_add(1, std::memory_order_relaxed);
            } catch (const std::exception& ex) {
                record_fatal(batches[index].name + ": " + ex.what());
                return;
            } catch (...) {
                record_fatal(batches[index].name + ": unknown distance oracle error");
                return;
            }
        }
    };

    for (std::size_t i = 0; i < workers_used; ++i) {
        pool.emplace_back(worker_fn, stop_source.get_token());
    }

    for (auto& thread : pool) {
        thread.join();
    }

    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    if (failed.load(std::memory_order_relaxed)) {
        return false;
    }

    for (const auto& result : out_results) {
        if (!result.ok) {
            ++out_stats.batches_failed;
        }
        out_stats.oracle_calls += result.stats.oracle_calls;
    }

    out_stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    return true;
}
