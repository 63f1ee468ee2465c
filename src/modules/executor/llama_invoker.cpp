// modules/executor/llama_invoker.cpp
#include "modules/executor/llama_invoker.h"
#include "common/logging/logger.h"
#include <stdexcept>

namespace agentkernel {

namespace {

constexpr size_t kSignatureChars = 512;

} // namespace

LlamaInvoker::LlamaInvoker(const LlmConfig& config) {
    for (ModelVariant variant : {ModelVariant::FAST, ModelVariant::REASONING, ModelVariant::THINKING}) {
        const std::string& path = config.path_for(variant);
        if (path.empty()) {
            throw std::runtime_error(std::string("No model configured for variant '") + to_string(variant) + "'");
        }

        auto& slot = by_path_[path];
        if (!slot) {
            LlamaAdapter::Config adapter_config;
            adapter_config.model_path = path;
            adapter_config.n_ctx = config.n_ctx;
            adapter_config.n_threads = config.n_threads;
            adapter_config.temperature = config.temperature;
            adapter_config.min_p = config.min_p;
            // thinking tier gets a larger generation allowance
            adapter_config.n_predict = variant == ModelVariant::THINKING ? config.n_predict * 2 : config.n_predict;

            slot = std::make_shared<Slot>();
            slot->adapter = std::make_unique<LlamaAdapter>(adapter_config);
        }
        by_variant_[variant] = slot;
    }
}

std::string LlamaInvoker::compose_prompt(const InvocationRequest& request) {
    std::string prompt;

    // 推理连续性: 上游签名
    if (!request.prior_signatures.empty()) {
        prompt += "[CONTEXT CONTINUITY]\n";
        for (const auto& [dep, signature] : request.prior_signatures) {
            prompt += "Previous Agent Signature (" + dep + "): " + signature + "\n";
        }
        prompt += "\n";
    }

    prompt += "You are agent '" + request.node.id + "' (" + to_string(request.node.role) + ").\n";
    if (!request.node.tools.empty()) {
        prompt += "Available tools:";
        for (const auto& tool : request.node.tools) {
            prompt += " " + tool;
        }
        prompt += "\n";
    }
    prompt += "\n" + request.prompt;

    if (!request.node.output_schema.is_null()) {
        prompt += "\n\nRespond with JSON matching this schema:\n" + request.node.output_schema.dump(2) + "\n";
    }
    return prompt;
}

Signature LlamaInvoker::signature_from(const std::string& text) {
    if (text.size() <= kSignatureChars) {
        return text;
    }
    return text.substr(text.size() - kSignatureChars);
}

InvocationResult LlamaInvoker::invoke(const InvocationRequest& request) {
    auto it = by_variant_.find(request.node.model);
    if (it == by_variant_.end()) {
        return InvocationResult::failure(std::string("No model for variant ") + to_string(request.node.model));
    }
    Slot& slot = *it->second;

    std::string prompt = compose_prompt(request);
    const CancellationToken& cancel = request.cancel;

    LlamaAdapter::Generation generation;
    {
        std::lock_guard lock(slot.mutex);
        if (cancel.cancelled()) {
            return InvocationResult::failure("cancelled before generation");
        }
        try {
            generation = slot.adapter->generate(prompt, [&cancel] { return cancel.cancelled(); });
        } catch (const std::runtime_error& e) {
            return InvocationResult::failure(e.what());
        }
    }

    uint64_t tokens = static_cast<uint64_t>(generation.prompt_tokens + generation.completion_tokens);
    if (generation.stopped) {
        return InvocationResult::failure("generation cancelled", tokens);
    }

    logger()->debug("Node '{}' generated {} tokens ({} prompt)", request.node.id, generation.completion_tokens,
                    generation.prompt_tokens);

    nlohmann::json output;
    if (!request.node.output_schema.is_null()) {
        output = nlohmann::json::parse(generation.text, nullptr, false);
        if (output.is_discarded()) {
            return InvocationResult::failure("Output is not valid JSON for the declared schema", tokens);
        }
    } else {
        output = nlohmann::json{{"result", generation.text}};
    }

    return InvocationResult::ok(std::move(output), signature_from(generation.text), tokens);
}

} // namespace agentkernel
