#pragma once

#include "word_embedder.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_vocab;

struct LlamaEmbedderConfig {
    std::string model_path;
    int n_ctx = 512;
    int n_gpu_layers = -1;
    int n_threads = 8;
};

// Word vectors from a GGUF embedding model: the mean-pooled embedding of the word's tokens.
class LlamaWordEmbedder final : public WordEmbedder {
public:
    explicit LlamaWordEmbedder(LlamaEmbedderConfig config);
    ~LlamaWordEmbedder() override;

    std::unique_ptr<WordEmbedder> clone() const override;
    bool embed(const std::string& word, std::vector<float>& out_vector) override;

private:
    struct SharedModel;

    LlamaWordEmbedder(LlamaEmbedderConfig config, std::shared_ptr<SharedModel> shared_model);

    static std::shared_ptr<SharedModel> load_shared_model(const LlamaEmbedderConfig& config);

    std::vector<int32_t> tokenize(const std::string& text, bool add_special) const;
    std::vector<float> pooled_embedding(const std::vector<int32_t>& tokens);

    void ensure_context_ready();

    LlamaEmbedderConfig config_;
    std::shared_ptr<SharedModel> shared_model_;
    std::unordered_map<std::string, std::optional<std::vector<float>>> cache_;

    llama_context* ctx_ = nullptr;
};
