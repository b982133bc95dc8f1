#pragma once

#include "distance_oracle.hpp"
#include "word_embedder.hpp"

#include <memory>

// Word Mover's Distance between two token sequences, using the embedder's vectors.
// Out-of-vocabulary tokens are ignored; a side with no known tokens is incomparable.
class WordMoverOracle final : public DistanceOracle {
public:
    explicit WordMoverOracle(std::unique_ptr<WordEmbedder> embedder);

    std::unique_ptr<DistanceOracle> clone() const override;
    double distance(const Tokens& from, const Tokens& to) override;

private:
    std::unique_ptr<WordEmbedder> embedder_;
};
