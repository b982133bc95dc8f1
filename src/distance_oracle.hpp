#pragma once

#include "tokenizer.hpp"

#include <memory>

class DistanceOracle {
public:
    virtual ~DistanceOracle() = default;

    // Per-thread isolation point: each worker gets its own oracle clone.
    virtual std::unique_ptr<DistanceOracle> clone() const = 0;

    // Non-negative and deterministic for a fixed pair; +infinity means incomparable.
    virtual double distance(const Tokens& from, const Tokens& to) = 0;
};
