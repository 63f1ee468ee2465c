// modules/executor/agent_invoker.cpp
#include "modules/executor/agent_invoker.h"
#include <sstream>

namespace agentkernel {

void to_json(nlohmann::json& j, const InvocationRequest& request) {
    nlohmann::json signatures = nlohmann::json::object();
    for (const auto& [dep, signature] : request.prior_signatures) {
        signatures[dep] = signature;
    }

    j = nlohmann::json{
        {"run_id", request.run_id},
        {"agent_id", request.node.id},
        {"role", to_string(request.node.role)},
        {"model", to_string(request.node.model)},
        {"prompt", request.prompt},
        {"input_data", request.input_data},
        {"prior_signatures", std::move(signatures)},
        {"tools", request.node.tools},
        {"file_paths", request.file_paths}
    };
    // deep thinking tier gets a fixed thinking budget
    j["thinking_level"] = request.node.model == ModelVariant::THINKING ? nlohmann::json(5) : nlohmann::json(nullptr);
    if (!request.node.output_schema.is_null()) {
        j["output_schema"] = request.node.output_schema;
    }
}

InvocationResult InvocationResult::ok(nlohmann::json output, std::optional<Signature> signature, uint64_t tokens) {
    InvocationResult result;
    result.success = true;
    result.output = std::move(output);
    result.signature = std::move(signature);
    result.tokens_used = tokens;
    return result;
}

InvocationResult InvocationResult::failure(std::string error, uint64_t tokens) {
    InvocationResult result;
    result.error = std::move(error);
    result.tokens_used = tokens;
    return result;
}

InvocationResult EchoInvoker::invoke(const InvocationRequest& request) {
    if (request.cancel.cancelled()) {
        return InvocationResult::failure("cancelled before start");
    }

    std::istringstream words(request.prompt);
    uint64_t tokens = 0;
    for (std::string word; words >> word;) {
        ++tokens;
    }

    nlohmann::json output{
        {"result", request.prompt},
        {"agent_id", request.node.id},
        {"dependencies", request.input_data}
    };
    return InvocationResult::ok(std::move(output), "echo:" + request.run_id + ":" + request.node.id, tokens);
}

} // namespace agentkernel
