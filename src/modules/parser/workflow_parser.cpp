// modules/parser/workflow_parser.cpp
#include "modules/parser/workflow_parser.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace agentkernel {

namespace {

// "<where>.<key>" for error messages
std::string field_name(const std::string& where, const char* key) {
    return where.empty() ? std::string(key) : where + "." + key;
}

std::string read_string(const nlohmann::json& j, const char* key, const std::string& where, bool required,
                        const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        if (required) {
            throw ConfigError("Missing required field '" + field_name(where, key) + "'");
        }
        return fallback;
    }
    if (!it->is_string()) {
        throw ConfigError("Field '" + field_name(where, key) + "' must be a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> read_string_list(const nlohmann::json& j, const char* key, const std::string& where) {
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        throw ConfigError("Field '" + field_name(where, key) + "' must be an array of strings");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw ConfigError("Field '" + field_name(where, key) + "' must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

uint64_t read_limit(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer()) {
        // negative integers parse as signed
        throw ConfigError(std::string("Field '") + key + "' must not be negative");
    }
    throw ConfigError(std::string("Field '") + key + "' must be a non-negative integer");
}

} // namespace

AgentNode WorkflowParser::create_node_from_json(const nlohmann::json& node_json, size_t position) {
    std::string where = "agents[" + std::to_string(position) + "]";
    if (!node_json.is_object()) {
        throw ConfigError("'" + where + "' must be an object");
    }

    AgentNode node;
    node.id = read_string(node_json, "id", where, true);
    if (node.id.empty()) {
        throw ConfigError("'" + where + ".id' must not be empty");
    }
    where = "agent '" + node.id + "'";

    node.role = parse_agent_role(read_string(node_json, "role", where, true));
    node.model = parse_model_variant(read_string(node_json, "model", where, false, "fast"));
    node.depends_on = read_string_list(node_json, "depends_on", where);
    node.prompt = read_string(node_json, "prompt", where, false);
    node.tools = read_string_list(node_json, "tools", where);
    node.input_schema = node_json.value("input_schema", nlohmann::json(nullptr));
    node.output_schema = node_json.value("output_schema", nlohmann::json(nullptr));

    if (auto it = node_json.find("accepts_directive"); it != node_json.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            throw ConfigError("Field '" + where + ".accepts_directive' must be a boolean");
        }
        node.accepts_directive = it->get<bool>();
    }
    node.user_directive = read_string(node_json, "user_directive", where, false);
    return node;
}

WorkflowConfig WorkflowParser::parse_from_json(const nlohmann::json& workflow_json) {
    if (!workflow_json.is_object()) {
        throw ConfigError("Workflow must be an object");
    }

    WorkflowConfig config;
    config.id = read_string(workflow_json, "id", "", true);
    config.name = read_string(workflow_json, "name", "", false, config.id);
    config.max_token_budget = read_limit(workflow_json, "max_token_budget");
    config.timeout_ms = read_limit(workflow_json, "timeout_ms");
    config.attached_files = read_string_list(workflow_json, "attached_files", "");

    auto agents_it = workflow_json.find("agents");
    if (agents_it == workflow_json.end() || !agents_it->is_array()) {
        throw ConfigError("Workflow '" + config.id + "' needs an 'agents' array");
    }

    std::unordered_set<NodeId> seen;
    size_t position = 0;
    for (const auto& node_json : *agents_it) {
        AgentNode node = create_node_from_json(node_json, position++);
        if (!seen.insert(node.id).second) {
            throw ConfigError("Duplicate node id '" + node.id + "' in workflow '" + config.id + "'");
        }
        config.agents.push_back(std::move(node));
    }
    return config;
}

WorkflowConfig WorkflowParser::parse_from_string(const std::string& content) {
    return parse_from_json(parse_document(content));
}

WorkflowConfig WorkflowParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

} // namespace agentkernel
