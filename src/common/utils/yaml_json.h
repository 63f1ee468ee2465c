#ifndef AGENTKERNEL_COMMON_UTILS_YAML_JSON_H
#define AGENTKERNEL_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentkernel {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a document that is either JSON or YAML (JSON first).
// Throws ConfigError if neither parser accepts it.
nlohmann::json parse_document(const std::string& text);

} // namespace agentkernel

#endif // AGENTKERNEL_COMMON_UTILS_YAML_JSON_H
