#pragma once

#include "word_embedder.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class WordVectorFormat {
    Auto,
    Text,
    Binary,
};

// Immutable word2vec vector table. Clones share the loaded data.
class WordVectorTable final : public WordEmbedder {
public:
    using Entry = std::pair<std::string, std::vector<float>>;

    // Throws std::runtime_error on unreadable or malformed files. limit == 0 reads every vector.
    static WordVectorTable load_word2vec(
        const std::filesystem::path& path,
        WordVectorFormat format = WordVectorFormat::Auto,
        std::size_t limit = 0
    );

    // Throws std::invalid_argument when an entry's size differs from dimensions.
    static WordVectorTable from_entries(std::size_t dimensions, const std::vector<Entry>& entries);

    std::unique_ptr<WordEmbedder> clone() const override;
    bool embed(const std::string& word, std::vector<float>& out_vector) override;

    std::size_t size() const;
    std::size_t dimensions() const;
    bool contains(const std::string& word) const;

private:
    struct Data;

    explicit WordVectorTable(std::shared_ptr<const Data> data);

    std::shared_ptr<const Data> data_;
};
