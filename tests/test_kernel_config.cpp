// tests/test_kernel_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/kernel_config.h"
#include "core/types/errors.h"
#include <filesystem>
#include <fstream>

using namespace agentkernel;
namespace fs = std::filesystem;

TEST_CASE("Missing config file yields defaults", "[config]") {
    auto config = load_kernel_config("/nonexistent/kernel_config.json");
    REQUIRE(config.max_concurrency >= 1);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.llm.model_path.empty());
    REQUIRE(config.llm.n_ctx == 2048);
}

TEST_CASE("Config fields are read and model paths resolved", "[config]") {
    auto config = kernel_config_from_json(
        {
            {"max_concurrency", 3},
            {"log_level", "debug"},
            {"llm",
             {{"model_path", "models/small.gguf"},
              {"models", {{"thinking", "/abs/big.gguf"}}},
              {"n_ctx", 8192},
              {"temperature", 0.2}}},
        },
        "/etc/agentkernel");

    REQUIRE(config.max_concurrency == 3);
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.llm.n_ctx == 8192);
    REQUIRE(config.llm.temperature == 0.2f);
    REQUIRE(fs::path(config.llm.model_path) == fs::path("/etc/agentkernel/models/small.gguf"));
    REQUIRE(config.llm.path_for(ModelVariant::THINKING) == "/abs/big.gguf");
    REQUIRE(config.llm.path_for(ModelVariant::FAST) == config.llm.model_path);
}

TEST_CASE("Bad config values are rejected", "[config]") {
    REQUIRE_THROWS_AS(kernel_config_from_json(nlohmann::json::array()), ConfigError);
    REQUIRE_THROWS_AS(kernel_config_from_json({{"max_concurrency", -2}}), ConfigError);
    REQUIRE_THROWS_AS(kernel_config_from_json({{"max_concurrency", "many"}}), ConfigError);
    REQUIRE_THROWS_AS(kernel_config_from_json({{"llm", {{"models", {{"gigantic", "x.gguf"}}}}}}), ConfigError);
}

TEST_CASE("Malformed config file is a ConfigError", "[config]") {
    auto path = fs::temp_directory_path() / "agentkernel_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ \"max_concurrency\": ";
    }
    REQUIRE_THROWS_AS(load_kernel_config(path.string()), ConfigError);
    fs::remove(path);
}
