#pragma once

#include <memory>
#include <string>
#include <vector>

class WordEmbedder {
public:
    virtual ~WordEmbedder() = default;

    virtual std::unique_ptr<WordEmbedder> clone() const = 0;

    // Returns false when the word has no representation in the model.
    virtual bool embed(const std::string& word, std::vector<float>& out_vector) = 0;
};
