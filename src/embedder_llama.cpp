#include "embedder_llama.hpp"

#include <llama.h>

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::once_flag g_backend_once;

void llama_log_quiet(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
        std::fputs(text, stderr);
    }
}

void initialize_backend_once() {
    std::call_once(g_backend_once, []() {
        llama_log_set(llama_log_quiet, nullptr);
        ggml_backend_load_all();
        llama_backend_init();
    });
}

}  // namespace

struct LlamaWordEmbedder::SharedModel {
    explicit SharedModel(const LlamaEmbedderConfig& config) {
        initialize_backend_once();

        llama_model_params params = llama_model_default_params();
        params.n_gpu_layers = config.n_gpu_layers;
        params.main_gpu = 0;
        params.use_mmap = true;

        model = llama_model_load_from_file(config.model_path.c_str(), params);
        if (model == nullptr) {
            throw std::runtime_error("llama_model_load_from_file failed for: " + config.model_path);
        }

        vocab = llama_model_get_vocab(model);
        if (vocab == nullptr) {
            llama_model_free(model);
            model = nullptr;
            throw std::runtime_error("llama_model_get_vocab returned null");
        }

        n_embd = llama_model_n_embd(model);
        if (n_embd <= 0) {
            llama_model_free(model);
            model = nullptr;
            throw std::runtime_error("Model reports no embedding dimension: " + config.model_path);
        }
    }

    ~SharedModel() {
        if (model != nullptr) {
            llama_model_free(model);
            model = nullptr;
            vocab = nullptr;
        }
    }

    llama_model* model = nullptr;
    const llama_vocab* vocab = nullptr;
    int32_t n_embd = 0;
};

LlamaWordEmbedder::LlamaWordEmbedder(LlamaEmbedderConfig config)
    : config_(std::move(config)), shared_model_(load_shared_model(config_)) {}

LlamaWordEmbedder::LlamaWordEmbedder(LlamaEmbedderConfig config, std::shared_ptr<SharedModel> shared_model)
    : config_(std::move(config)), shared_model_(std::move(shared_model)) {}

LlamaWordEmbedder::~LlamaWordEmbedder() {
    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
}

std::shared_ptr<LlamaWordEmbedder::SharedModel> LlamaWordEmbedder::load_shared_model(const LlamaEmbedderConfig& config) {
    return std::make_shared<SharedModel>(config);
}

void LlamaWordEmbedder::ensure_context_ready() {
    if (ctx_ != nullptr) {
        return;
    }

    llama_context_params params = llama_context_default_params();
    params.n_ctx = static_cast<uint32_t>(std::max(64, config_.n_ctx));
    params.n_batch = params.n_ctx;
    params.n_ubatch = params.n_ctx;
    params.n_threads = std::max(1, config_.n_threads);
    params.n_threads_batch = std::max(1, config_.n_threads);
    params.embeddings = true;
    params.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    params.no_perf = true;

    ctx_ = llama_init_from_model(shared_model_->model, params);
    if (ctx_ == nullptr) {
        throw std::runtime_error("llama_init_from_model failed");
    }
}

std::unique_ptr<WordEmbedder> LlamaWordEmbedder::clone() const {
    return std::unique_ptr<WordEmbedder>(new LlamaWordEmbedder(config_, shared_model_));
}

std::vector<int32_t> LlamaWordEmbedder::tokenize(const std::string& text, bool add_special) const {
    const int32_t probe = llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        nullptr,
        0,
        add_special,
        false
    );

    if (probe == 0) {
        return {};
    }

    const int32_t required = probe < 0 ? -probe : probe;
    std::vector<llama_token> tokens(static_cast<std::size_t>(required));
    const int32_t written = llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        tokens.data(),
        static_cast<int32_t>(tokens.size()),
        add_special,
        false
    );

    if (written < 0) {
        throw std::runtime_error("llama_tokenize failed while writing tokens for '" + text + "'");
    }

    tokens.resize(static_cast<std::size_t>(written));
    return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::vector<float> LlamaWordEmbedder::pooled_embedding(const std::vector<int32_t>& tokens) {
    ensure_context_ready();

    const uint32_t n_ctx_actual = llama_n_ctx(ctx_);
    if (tokens.size() >= n_ctx_actual) {
        throw std::runtime_error(
            "Word too long for context window (tokens=" + std::to_string(tokens.size()) +
            ", n_ctx=" + std::to_string(n_ctx_actual) + ")"
        );
    }

    llama_memory_clear(llama_get_memory(ctx_), true);

    llama_batch batch = llama_batch_init(static_cast<int32_t>(tokens.size()), 0, 1);
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        batch.token[i] = static_cast<llama_token>(tokens[i]);
        batch.pos[i] = static_cast<llama_pos>(i);
        batch.n_seq_id[i] = 1;
        batch.seq_id[i][0] = 0;
        batch.logits[i] = true;
    }
    batch.n_tokens = static_cast<int32_t>(tokens.size());

    const bool encoder_only = llama_model_has_encoder(shared_model_->model) &&
        !llama_model_has_decoder(shared_model_->model);
    const int32_t rc = encoder_only ? llama_encode(ctx_, batch) : llama_decode(ctx_, batch);
    llama_batch_free(batch);
    if (rc != 0) {
        throw std::runtime_error(encoder_only ? "llama_encode failed" : "llama_decode failed");
    }

    const float* pooled = llama_get_embeddings_seq(ctx_, 0);
    if (pooled == nullptr) {
        throw std::runtime_error("llama_get_embeddings_seq returned null");
    }

    return std::vector<float>(pooled, pooled + shared_model_->n_embd);
}

bool LlamaWordEmbedder::embed(const std::string& word, std::vector<float>& out_vector) {
    const auto cached = cache_.find(word);
    if (cached != cache_.end()) {
        if (!cached->second) {
            return false;
        }
        out_vector = *cached->second;
        return true;
    }

    // A word the vocabulary cannot tokenize has no representation.
    if (tokenize(word, false).empty()) {
        cache_.emplace(word, std::nullopt);
        return false;
    }

    std::vector<float> vector = pooled_embedding(tokenize(word, true));
    out_vector = vector;
    cache_.emplace(word, std::move(vector));
    return true;
}
