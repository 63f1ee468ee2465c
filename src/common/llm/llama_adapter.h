#ifndef AGENTKERNEL_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTKERNEL_COMMON_LLM_LLAMA_ADAPTER_H

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <llama.h>

namespace agentkernel {

// One loaded GGUF model with a single context. Not thread-safe: callers
// serialize generate() per adapter.
class LlamaAdapter {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    struct Generation {
        std::string text;
        int prompt_tokens = 0;
        int completion_tokens = 0;
        bool stopped = false; // should_stop() interrupted decoding
    };

    // Throws std::runtime_error if the model or context cannot be created
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter();

    // Each call starts from an empty KV cache. should_stop is polled once per token.
    Generation generate(const std::string& prompt, const std::function<bool()>& should_stop = {});
    bool is_loaded() const;
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace agentkernel

#endif // AGENTKERNEL_COMMON_LLM_LLAMA_ADAPTER_H
