#include "sequencer.hpp"

#include <cmath>
#include <exception>
#include <optional>

namespace {

struct Candidate {
    std::size_t position = 0;
    double distance = 0.0;
};

struct Pending {
    std::size_t source = 0;
    Tokens tokens;
};

}  // namespace

const char* sequence_error_name(SequenceErrorKind kind) {
    switch (kind) {
        case SequenceErrorKind::None:
            return "None";
        case SequenceErrorKind::EmptyInput:
            return "EmptyInput";
        case SequenceErrorKind::OracleFailure:
            return "OracleFailure";
        case SequenceErrorKind::NoSelectableCandidate:
            return "NoSelectableCandidate";
    }
    return "Unknown";
}

bool sequence_segments(
    const std::vector<Segment>& segments,
    DistanceOracle& oracle,
    std::vector<Segment>& out_ordered,
    SequenceFailure& out_failure,
    SequenceStats* out_stats
) {
    const auto started = std::chrono::steady_clock::now();

    SequenceStats stats;
    stats.segments_total = segments.size();
    out_failure = SequenceFailure{};
    out_ordered.clear();

    auto finish = [&](bool ok) {
        stats.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started
        );
        if (out_stats != nullptr) {
            *out_stats = stats;
        }
        if (!ok) {
            out_ordered.clear();
        }
        return ok;
    };

    if (segments.empty()) {
        out_failure.kind = SequenceErrorKind::EmptyInput;
        out_failure.message = "No segments to sequence";
        return finish(false);
    }

    out_ordered.reserve(segments.size());
    out_ordered.push_back(segments.front());
    if (segments.size() == 1) {
        return finish(true);
    }

    std::vector<Pending> remaining;
    remaining.reserve(segments.size() - 1);
    for (std::size_t i = 1; i < segments.size(); ++i) {
        remaining.push_back(Pending{i, split_whitespace(segments[i].text)});
    }

    Tokens last_tokens = split_whitespace(segments.front().text);

    while (!remaining.empty()) {
        const std::size_t step = stats.steps_completed + 1;
        std::optional<Candidate> best;

        for (std::size_t pos = 0; pos < remaining.size(); ++pos) {
            double dist = 0.0;
            try {
                ++stats.oracle_calls;
                dist = oracle.distance(last_tokens, remaining[pos].tokens);
            } catch (const std::exception& ex) {
                out_failure.kind = SequenceErrorKind::OracleFailure;
                out_failure.message = ex.what();
                out_failure.step = step;
                return finish(false);
            }

            // NaN and infinities are incomparable and never selected.
            if (!std::isfinite(dist)) {
                continue;
            }
            if (!best || dist < best->distance) {
                best = Candidate{pos, dist};
            }
        }

        if (!best) {
            out_failure.kind = SequenceErrorKind::NoSelectableCandidate;
            out_failure.message = "No remaining segment has a comparable distance to '" +
                out_ordered.back().id + "' (" + std::to_string(remaining.size()) + " candidates)";
            out_failure.step = step;
            return finish(false);
        }

        Pending chosen = std::move(remaining[best->position]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best->position));

        out_ordered.push_back(segments[chosen.source]);
        last_tokens = std::move(chosen.tokens);
        ++stats.steps_completed;
    }

    return finish(true);
}
