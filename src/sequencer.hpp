#pragma once

#include "distance_oracle.hpp"
#include "segment.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

enum class SequenceErrorKind {
    None,
    EmptyInput,
    OracleFailure,
    NoSelectableCandidate,
};

struct SequenceFailure {
    SequenceErrorKind kind = SequenceErrorKind::None;
    std::string message;
    // Chaining step (1-based) at which the failure happened, 0 when before chaining.
    std::size_t step = 0;
};

struct SequenceStats {
    std::size_t segments_total = 0;
    std::size_t oracle_calls = 0;
    std::size_t steps_completed = 0;
    std::chrono::microseconds wall_time{0};
};

const char* sequence_error_name(SequenceErrorKind kind);

// Greedy nearest-neighbour chaining. segments[0] is the anchor; each following
// position takes the remaining segment closest to the last placed one, measured
// as oracle.distance(last, candidate). Ties keep the earlier candidate.
bool sequence_segments(
    const std::vector<Segment>& segments,
    DistanceOracle& oracle,
    std::vector<Segment>& out_ordered,
    SequenceFailure& out_failure,
    SequenceStats* out_stats = nullptr
);
