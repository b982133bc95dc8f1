#include "wmd_oracle.hpp"

#include "transport.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

constexpr double kZeroCostEpsilon = 1e-8;

struct BagOfWords {
    std::vector<std::size_t> terms;
    std::vector<double> weights;
};

struct Vocabulary {
    std::unordered_map<std::string, std::size_t> ids;
    std::vector<std::vector<float>> vectors;
};

void normalize(std::vector<float>& vector) {
    double norm = 0.0;
    for (float v : vector) {
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0) {
        return;
    }
    for (float& v : vector) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
}

double euclidean(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::runtime_error(
            "Embedding dimension mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size())
        );
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

BagOfWords build_bag(const Tokens& tokens, WordEmbedder& embedder, Vocabulary& vocab) {
    BagOfWords bag;
    std::unordered_map<std::size_t, std::size_t> slot_of_term;
    std::size_t known = 0;
    std::vector<float> vector;

    for (const auto& token : tokens) {
        auto it = vocab.ids.find(token);
        if (it == vocab.ids.end()) {
            if (!embedder.embed(token, vector)) {
                continue;
            }
            normalize(vector);
            it = vocab.ids.emplace(token, vocab.vectors.size()).first;
            vocab.vectors.push_back(vector);
        }

        ++known;
        const auto [slot, inserted] = slot_of_term.emplace(it->second, bag.terms.size());
        if (inserted) {
            bag.terms.push_back(it->second);
            bag.weights.push_back(0.0);
        }
        bag.weights[slot->second] += 1.0;
    }

    for (double& w : bag.weights) {
        w /= static_cast<double>(known);
    }

    return bag;
}

bool same_bag(const BagOfWords& a, const BagOfWords& b) {
    if (a.terms.size() != b.terms.size()) {
        return false;
    }
    std::map<std::size_t, double> weights;
    for (std::size_t i = 0; i < a.terms.size(); ++i) {
        weights.emplace(a.terms[i], a.weights[i]);
    }
    for (std::size_t i = 0; i < b.terms.size(); ++i) {
        const auto it = weights.find(b.terms[i]);
        if (it == weights.end() || it->second != b.weights[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

WordMoverOracle::WordMoverOracle(std::unique_ptr<WordEmbedder> embedder) : embedder_(std::move(embedder)) {
    if (!embedder_) {
        throw std::invalid_argument("WordMoverOracle requires an embedder");
    }
}

std::unique_ptr<DistanceOracle> WordMoverOracle::clone() const {
    return std::make_unique<WordMoverOracle>(embedder_->clone());
}

double WordMoverOracle::distance(const Tokens& from, const Tokens& to) {
    Vocabulary vocab;
    const BagOfWords source = build_bag(from, *embedder_, vocab);
    const BagOfWords target = build_bag(to, *embedder_, vocab);

    if (source.terms.empty() || target.terms.empty()) {
        return std::numeric_limits<double>::infinity();
    }

    if (vocab.vectors.size() == 1 || same_bag(source, target)) {
        return 0.0;
    }

    std::vector<double> cost(source.terms.size() * target.terms.size());
    double total_cost = 0.0;
    for (std::size_t i = 0; i < source.terms.size(); ++i) {
        for (std::size_t j = 0; j < target.terms.size(); ++j) {
            const double d = euclidean(vocab.vectors[source.terms[i]], vocab.vectors[target.terms[j]]);
            cost[i * target.terms.size() + j] = d;
            total_cost += d;
        }
    }

    // Distinct words whose vectors all coincide give no usable ground cost.
    if (total_cost < kZeroCostEpsilon) {
        return std::numeric_limits<double>::infinity();
    }

    return earth_movers_distance(source.weights, target.weights, cost);
}
