// modules/parser/workflow_parser.h
#ifndef AGENTKERNEL_MODULES_PARSER_WORKFLOW_PARSER_H
#define AGENTKERNEL_MODULES_PARSER_WORKFLOW_PARSER_H

#include "core/types/node.h" // 引入 AgentNode, WorkflowConfig
#include <nlohmann/json.hpp>
#include <string>

namespace agentkernel {

// Reads WorkflowConfig documents (JSON, or the same structure in YAML).
// Every structural problem is a ConfigError; graph problems (unknown
// dependencies, cycles) are left to validate().
class WorkflowParser {
public:
    WorkflowConfig parse_from_string(const std::string& content);
    WorkflowConfig parse_from_file(const std::string& file_path);
    WorkflowConfig parse_from_json(const nlohmann::json& workflow_json);

    AgentNode create_node_from_json(const nlohmann::json& node_json, size_t position);
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_PARSER_WORKFLOW_PARSER_H
