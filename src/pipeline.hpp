#pragma once

#include "distance_oracle.hpp"
#include "fragment_reader.hpp"
#include "sequencer.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct BatchResult {
    bool ok = false;
    std::vector<Segment> ordered;
    SequenceFailure failure;
    SequenceStats stats;
};

struct PipelineStats {
    std::size_t batches_total = 0;
    std::size_t batches_failed = 0;
    std::size_t workers_used = 0;
    std::size_t oracle_calls = 0;
    std::chrono::milliseconds wall_time{0};
};

// Sequences independent batches concurrently. A batch whose sequencing fails is
// recorded in its BatchResult and does not stop the others; returns false only
// when a worker cannot run at all (error is set).
bool sequence_batches_parallel(
    const std::vector<FragmentBatch>& batches,
    const DistanceOracle& prototype,
    std::size_t workers,
    std::vector<BatchResult>& out_results,
    PipelineStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);
