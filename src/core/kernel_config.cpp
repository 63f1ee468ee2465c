// core/kernel_config.cpp
#include "core/kernel_config.h"
#include "core/types/errors.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

namespace agentkernel {

namespace {

namespace fs = std::filesystem;

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    fs::path dir = base_dir.empty() ? fs::path(".") : fs::path(base_dir);
    return fs::absolute(dir / path).lexically_normal().string();
}

// Reads j[key] into out when present; wrong type -> ConfigError
template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Kernel config field '") + key + "': " + e.what());
    }
}

} // namespace

const std::string& LlmConfig::path_for(ModelVariant variant) const {
    auto it = model_paths.find(variant);
    return it != model_paths.end() ? it->second : model_path;
}

KernelConfig kernel_config_from_json(const nlohmann::json& j, const std::string& base_dir) {
    if (!j.is_object()) {
        throw ConfigError("Kernel config must be a JSON object");
    }

    KernelConfig config;
    int64_t max_concurrency = 0;
    read_field(j, "max_concurrency", max_concurrency);
    if (max_concurrency < 0) {
        throw ConfigError("max_concurrency must not be negative");
    }
    config.max_concurrency = static_cast<size_t>(max_concurrency);
    read_field(j, "log_level", config.log_level);
    read_field(j, "log_pattern", config.log_pattern);

    auto llm_it = j.find("llm");
    if (llm_it != j.end() && llm_it->is_object()) {
        const auto& llm = *llm_it;
        auto& out = config.llm;

        std::string model_path;
        read_field(llm, "model_path", model_path);
        if (!model_path.empty()) {
            out.model_path = resolve_path(base_dir, model_path);
        }

        auto models_it = llm.find("models");
        if (models_it != llm.end() && models_it->is_object()) {
            for (const auto& [variant, path] : models_it->items()) {
                if (!path.is_string()) {
                    throw ConfigError("llm.models." + variant + " must be a string");
                }
                out.model_paths[parse_model_variant(variant)] = resolve_path(base_dir, path.get<std::string>());
            }
        }

        read_field(llm, "n_ctx", out.n_ctx);
        read_field(llm, "n_threads", out.n_threads);
        if (out.n_threads <= 0) {
            out.n_threads = static_cast<int>(std::thread::hardware_concurrency());
        }
        read_field(llm, "temperature", out.temperature);
        read_field(llm, "min_p", out.min_p);
        read_field(llm, "n_predict", out.n_predict);
    }

    if (config.max_concurrency == 0) {
        config.max_concurrency = std::max(1u, std::thread::hardware_concurrency());
    }
    return config;
}

KernelConfig load_kernel_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return kernel_config_from_json(nlohmann::json::object());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid kernel config " + config_path + ": " + e.what());
    }
    return kernel_config_from_json(j, fs::path(config_path).parent_path().string());
}

} // namespace agentkernel
