// modules/executor/invocation_builder.cpp
#include "modules/executor/invocation_builder.h"
#include "common/utils/template_renderer.h"

namespace agentkernel {

namespace {

// Text shown to the model for a dependency's output
std::string context_text(const nlohmann::json& output) {
    if (output.is_string()) {
        return output.get<std::string>();
    }
    if (output.is_object()) {
        for (const char* key : {"result", "output"}) {
            auto it = output.find(key);
            if (it != output.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    if (output.is_null()) {
        return "No text output";
    }
    return output.dump();
}

} // namespace

InvocationRequest build_invocation(const RunId& run_id,
                                   const ExecutionPlan& plan,
                                   const NodeId& node_id,
                                   std::map<NodeId, Signature> prior_signatures,
                                   const std::map<NodeId, nlohmann::json>& dependency_outputs,
                                   CancellationToken cancel) {
    const AgentNode& node = plan.node(node_id);

    InvocationRequest request;
    request.run_id = run_id;
    request.node = node;
    request.prior_signatures = std::move(prior_signatures);
    request.file_paths = plan.config().attached_files;
    request.cancel = std::move(cancel);

    for (const auto& [dep, output] : dependency_outputs) {
        request.input_data[dep] = output;
    }

    nlohmann::json signatures = nlohmann::json::object();
    for (const auto& [dep, signature] : request.prior_signatures) {
        signatures[dep] = signature;
    }

    nlohmann::json data{
        {"node", {{"id", node.id}, {"role", to_string(node.role)}, {"model", to_string(node.model)}}},
        {"run_id", run_id},
        {"dependencies", request.input_data},
        {"signatures", std::move(signatures)},
        {"user_directive", node.accepts_directive ? node.user_directive : std::string()}
    };

    std::string prompt = node.prompt.empty() ? std::string() : InjaTemplateRenderer::render(node.prompt, data);

    // dependencies in declaration order
    for (const auto& dep : plan.dependencies(node_id)) {
        auto it = dependency_outputs.find(dep);
        if (it == dependency_outputs.end()) {
            continue;
        }
        prompt += "\n\n=== CONTEXT FROM AGENT " + dep + " ===\n" + context_text(it->second) + "\n";
    }
    request.prompt = std::move(prompt);
    return request;
}

} // namespace agentkernel
