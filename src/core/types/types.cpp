// core/types/types.cpp
#include "core/types/node.h"
#include "core/types/status.h"
#include "core/types/errors.h"
#include <sstream>

namespace agentkernel {

const char* to_string(AgentRole role) {
    switch (role) {
        case AgentRole::ORCHESTRATOR: return "orchestrator";
        case AgentRole::WORKER: return "worker";
        case AgentRole::OBSERVER: return "observer";
    }
    return "unknown";
}

const char* to_string(ModelVariant model) {
    switch (model) {
        case ModelVariant::FAST: return "fast";
        case ModelVariant::REASONING: return "reasoning";
        case ModelVariant::THINKING: return "thinking";
    }
    return "unknown";
}

AgentRole parse_agent_role(std::string_view name) {
    if (name == "orchestrator") return AgentRole::ORCHESTRATOR;
    if (name == "worker") return AgentRole::WORKER;
    if (name == "observer") return AgentRole::OBSERVER;
    throw ConfigError("Unknown agent role '" + std::string(name) + "'");
}

ModelVariant parse_model_variant(std::string_view name) {
    if (name == "fast" || name == "flash") return ModelVariant::FAST;
    if (name == "reasoning" || name == "pro") return ModelVariant::REASONING;
    if (name == "thinking" || name == "deep-think" || name == "deepthink") return ModelVariant::THINKING;
    throw ConfigError("Unknown model variant '" + std::string(name) + "'");
}

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::IDLE: return "idle";
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::PENDING: return "pending";
        case NodeStatus::RUNNING: return "running";
        case NodeStatus::COMPLETED: return "completed";
        case NodeStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "none";
        case FailureKind::INVOCATION_ERROR: return "invocation_error";
        case FailureKind::MISSING_SIGNATURE: return "missing_signature";
        case FailureKind::TIMEOUT: return "timeout";
        case FailureKind::BUDGET_EXCEEDED: return "budget_exceeded";
        case FailureKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(GraphErrorKind kind) {
    switch (kind) {
        case GraphErrorKind::UNKNOWN_DEPENDENCY: return "UnknownDependency";
        case GraphErrorKind::CYCLE_DETECTED: return "CycleDetected";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const AgentNode& node) {
    j = nlohmann::json{
        {"id", node.id},
        {"role", to_string(node.role)},
        {"model", to_string(node.model)},
        {"depends_on", node.depends_on},
        {"prompt", node.prompt},
        {"tools", node.tools}
    };
    if (!node.input_schema.is_null()) j["input_schema"] = node.input_schema;
    if (!node.output_schema.is_null()) j["output_schema"] = node.output_schema;
    if (node.accepts_directive) {
        j["accepts_directive"] = true;
        j["user_directive"] = node.user_directive;
    }
}

void to_json(nlohmann::json& j, const WorkflowConfig& config) {
    j = nlohmann::json{
        {"id", config.id},
        {"name", config.name},
        {"agents", config.agents},
        {"max_token_budget", config.max_token_budget},
        {"timeout_ms", config.timeout_ms},
        {"attached_files", config.attached_files}
    };
}

// --- GraphError ---

GraphError::GraphError(GraphErrorKind kind, NodeId node, std::optional<NodeId> dependency,
                       std::vector<NodeId> cycle, const std::string& message)
    : std::runtime_error(message),
      kind_(kind),
      node_(std::move(node)),
      dependency_(std::move(dependency)),
      cycle_(std::move(cycle)) {}

GraphError GraphError::unknown_dependency(const NodeId& node, const NodeId& dependency) {
    return GraphError(GraphErrorKind::UNKNOWN_DEPENDENCY, node, dependency, {},
                      "Node '" + node + "' depends on unknown node '" + dependency + "'");
}

GraphError GraphError::cycle_detected(std::vector<NodeId> cycle) {
    std::ostringstream oss;
    oss << "Cycle detected: ";
    for (size_t i = 0; i < cycle.size(); ++i) {
        oss << cycle[i] << " -> ";
    }
    NodeId first = cycle.empty() ? NodeId{} : cycle.front();
    oss << first;
    return GraphError(GraphErrorKind::CYCLE_DETECTED, first, std::nullopt, std::move(cycle), oss.str());
}

// --- InvalidTransitionError ---

InvalidTransitionError::InvalidTransitionError(const RunId& run_id, const NodeId& node_id,
                                               NodeStatus current, NodeStatus requested,
                                               const std::string& reason)
    : std::runtime_error("Invalid transition for node '" + node_id + "' in run " + run_id + ": " +
                         to_string(current) + " -> " + to_string(requested) +
                         (reason.empty() ? "" : " (" + reason + ")")),
      run_id_(run_id),
      node_id_(node_id),
      current_(current) {}

InvalidTransitionError::InvalidTransitionError(const RunId& run_id, const std::string& reason)
    : std::runtime_error("Invalid transition for run " + run_id + ": " + reason),
      run_id_(run_id) {}

} // namespace agentkernel
