// modules/executor/llama_invoker.h
#ifndef AGENTKERNEL_MODULES_EXECUTOR_LLAMA_INVOKER_H
#define AGENTKERNEL_MODULES_EXECUTOR_LLAMA_INVOKER_H

#include "modules/executor/agent_invoker.h"
#include "common/llm/llama_adapter.h"
#include "core/kernel_config.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace agentkernel {

// Runs every node on a local GGUF model. Variants that resolve to the same
// model file share one loaded adapter; generation on an adapter is serialized.
class LlamaInvoker : public AgentInvoker {
public:
    // Loads each distinct model eagerly; throws std::runtime_error on failure
    explicit LlamaInvoker(const LlmConfig& config);

    InvocationResult invoke(const InvocationRequest& request) override;

    // Exposed for tests and the CLI
    static std::string compose_prompt(const InvocationRequest& request);
    static Signature signature_from(const std::string& text);

private:
    struct Slot {
        std::unique_ptr<LlamaAdapter> adapter;
        std::mutex mutex;
    };

    std::map<std::string, std::shared_ptr<Slot>> by_path_;
    std::map<ModelVariant, std::shared_ptr<Slot>> by_variant_;
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_EXECUTOR_LLAMA_INVOKER_H
