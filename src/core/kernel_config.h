// core/kernel_config.h
#ifndef AGENTKERNEL_CORE_KERNEL_CONFIG_H
#define AGENTKERNEL_CORE_KERNEL_CONFIG_H

#include "core/types/node.h" // 引入 ModelVariant
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace agentkernel {

// llama.cpp backend settings; paths are absolute after loading
struct LlmConfig {
    std::string model_path;                           // default for every variant
    std::map<ModelVariant, std::string> model_paths;  // per-variant override
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;

    // Override if present, else model_path
    const std::string& path_for(ModelVariant variant) const;
};

struct KernelConfig {
    size_t max_concurrency = 0; // 0 -> hardware concurrency
    std::string log_level = "info";
    std::string log_pattern;    // empty -> default pattern
    LlmConfig llm;
};

// Missing file -> defaults. Malformed JSON or a wrongly typed field -> ConfigError.
// Relative model paths are resolved against the config file's directory.
KernelConfig load_kernel_config(const std::string& config_path = "kernel_config.json");

// Same, from an already parsed object; `base_dir` anchors relative model paths
KernelConfig kernel_config_from_json(const nlohmann::json& j, const std::string& base_dir = ".");

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_KERNEL_CONFIG_H
