#ifndef AGENTKERNEL_CORE_TYPES_NODE_H
#define AGENTKERNEL_CORE_TYPES_NODE_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agentkernel {

// 节点 / 运行标识
using NodeId = std::string;
using RunId = std::string;
using Signature = std::string; // opaque thought signature

// Scheduling classification, does not change graph shape
enum class AgentRole : uint8_t {
    ORCHESTRATOR,
    WORKER,
    OBSERVER
};

// Execution backend tier
enum class ModelVariant : uint8_t {
    FAST,       // "fast" / "flash"
    REASONING,  // "reasoning" / "pro"
    THINKING    // "thinking" / "deep-think"
};

struct AgentNode {
    NodeId id;
    AgentRole role = AgentRole::WORKER;
    ModelVariant model = ModelVariant::FAST;
    std::vector<NodeId> depends_on; // edges: dependency -> this node
    std::string prompt;             // inja template
    std::vector<std::string> tools;
    nlohmann::json input_schema = nullptr;
    nlohmann::json output_schema = nullptr;
    bool accepts_directive = false;
    std::string user_directive;
};

struct WorkflowConfig {
    std::string id;
    std::string name;
    std::vector<AgentNode> agents; // declaration order matters for tie-breaking
    uint64_t max_token_budget = 0; // 0 表示无限制
    uint64_t timeout_ms = 0;       // 0 表示无超时
    std::vector<std::string> attached_files;
};

const char* to_string(AgentRole role);
const char* to_string(ModelVariant model);

// Throw ConfigError on unknown names
AgentRole parse_agent_role(std::string_view name);
ModelVariant parse_model_variant(std::string_view name);

void to_json(nlohmann::json& j, const AgentNode& node);
void to_json(nlohmann::json& j, const WorkflowConfig& config);

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_TYPES_NODE_H
