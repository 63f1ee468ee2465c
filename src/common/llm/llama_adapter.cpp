// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include "common/logging/logger.h"
#include <stdexcept>

namespace agentkernel {

namespace {

// min_p -> temperature -> dist
llama_sampler* make_sampler(const LlamaAdapter::Config& config) {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(chain, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(chain, llama_sampler_init_temp(config.temperature));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return chain;
}

} // namespace

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {
    auto mparams = llama_model_default_params();
    mparams.n_gpu_layers = 99; // offload everything the backend accepts
    model_.reset(llama_model_load_from_file(config_.model_path.c_str(), mparams));
    if (!model_) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }

    auto cparams = llama_context_default_params();
    cparams.n_ctx = static_cast<uint32_t>(config_.n_ctx);
    cparams.n_threads = config_.n_threads;
    cparams.n_threads_batch = config_.n_threads;
    ctx_.reset(llama_init_from_model(model_.get(), cparams));
    if (!ctx_) {
        throw std::runtime_error("Failed to create context for " + config_.model_path);
    }

    sampler_.reset(make_sampler(config_));
    logger()->info("Loaded model {} (n_ctx={}, threads={})", config_.model_path, config_.n_ctx,
                   config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // first call with no buffer returns -(required size)
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

LlamaAdapter::Generation LlamaAdapter::generate(const std::string& prompt,
                                                const std::function<bool()>& should_stop) {
    if (!is_loaded()) {
        throw std::runtime_error("Model not loaded");
    }

    // every invocation is independent
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= config_.n_ctx) {
        throw std::runtime_error("Prompt of " + std::to_string(tokens.size()) +
                                 " tokens does not fit context of " + std::to_string(config_.n_ctx));
    }

    Generation result;
    result.prompt_tokens = static_cast<int>(tokens.size());

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    for (int i = 0; i < config_.n_predict; ++i) {
        if (should_stop && should_stop()) {
            result.stopped = true;
            break;
        }

        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }

        result.text += detokenize(new_token);
        ++result.completion_tokens;

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            logger()->warn("Decode failed after {} tokens, returning partial output", result.completion_tokens);
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return result;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace agentkernel
