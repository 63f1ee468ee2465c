// tests/test_workflow_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/parser/workflow_parser.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace agentkernel;

// Test 1: full JSON document
TEST_CASE("Parse JSON workflow", "[parser]") {
    std::string json = R"({
        "id": "research",
        "name": "Research pipeline",
        "max_token_budget": 5000,
        "timeout_ms": 60000,
        "attached_files": ["notes.md"],
        "agents": [
            {"id": "plan", "role": "orchestrator", "model": "pro", "prompt": "Plan {{ user_directive }}",
             "accepts_directive": true, "user_directive": "caching"},
            {"id": "search", "role": "worker", "depends_on": ["plan"], "tools": ["web_search"],
             "output_schema": {"type": "object"}},
            {"id": "audit", "role": "observer", "model": "deep-think", "depends_on": ["plan", "search"]}
        ]
    })";

    WorkflowParser parser;
    auto config = parser.parse_from_string(json);

    REQUIRE(config.id == "research");
    REQUIRE(config.name == "Research pipeline");
    REQUIRE(config.max_token_budget == 5000);
    REQUIRE(config.timeout_ms == 60000);
    REQUIRE(config.attached_files == std::vector<std::string>{"notes.md"});
    REQUIRE(config.agents.size() == 3);

    const auto& plan = config.agents[0];
    REQUIRE(plan.role == AgentRole::ORCHESTRATOR);
    REQUIRE(plan.model == ModelVariant::REASONING);
    REQUIRE(plan.accepts_directive);
    REQUIRE(plan.user_directive == "caching");

    const auto& search = config.agents[1];
    REQUIRE(search.model == ModelVariant::FAST);
    REQUIRE(search.depends_on == std::vector<NodeId>{"plan"});
    REQUIRE(search.tools == std::vector<std::string>{"web_search"});
    REQUIRE(search.output_schema["type"] == "object");
    REQUIRE(search.input_schema.is_null());

    REQUIRE(config.agents[2].role == AgentRole::OBSERVER);
    REQUIRE(config.agents[2].model == ModelVariant::THINKING);
}

TEST_CASE("Parse YAML workflow", "[parser][yaml]") {
    std::string yaml = R"(
id: yaml-flow
agents:
  - id: a
    role: worker
    prompt: "Say {{ node.id }}"
  - id: b
    role: worker
    model: flash
    depends_on: [a]
    accepts_directive: false
)";

    WorkflowParser parser;
    auto config = parser.parse_from_string(yaml);
    REQUIRE(config.id == "yaml-flow");
    REQUIRE(config.name == "yaml-flow");
    REQUIRE(config.agents.size() == 2);
    REQUIRE(config.agents[0].prompt == "Say {{ node.id }}");
    REQUIRE(config.agents[1].depends_on == std::vector<NodeId>{"a"});
    REQUIRE_FALSE(config.agents[1].accepts_directive);
    REQUIRE(config.max_token_budget == 0);
}

TEST_CASE("Structural problems are configuration errors", "[parser]") {
    WorkflowParser parser;

    SECTION("missing agents") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"({"id": "x"})"), ConfigError);
    }
    SECTION("missing role") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"({"id": "x", "agents": [{"id": "a"}]})"), ConfigError);
    }
    SECTION("unknown role") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"({"id": "x", "agents": [{"id": "a", "role": "boss"}]})"),
                          ConfigError);
    }
    SECTION("unknown model") {
        REQUIRE_THROWS_AS(
            parser.parse_from_string(R"({"id": "x", "agents": [{"id": "a", "role": "worker", "model": "huge"}]})"),
            ConfigError);
    }
    SECTION("depends_on must be a list of strings") {
        REQUIRE_THROWS_AS(
            parser.parse_from_string(R"({"id": "x", "agents": [{"id": "a", "role": "worker", "depends_on": "b"}]})"),
            ConfigError);
    }
    SECTION("negative budget") {
        REQUIRE_THROWS_AS(parser.parse_from_string(R"({"id": "x", "max_token_budget": -1, "agents": []})"),
                          ConfigError);
    }
    SECTION("duplicate node id") {
        REQUIRE_THROWS_AS(parser.parse_from_string(
                              R"({"id": "x", "agents": [{"id": "a", "role": "worker"}, {"id": "a", "role": "worker"}]})"),
                          ConfigError);
    }
    SECTION("not a document") {
        REQUIRE_THROWS_AS(parser.parse_from_string("agents: [unclosed"), ConfigError);
    }
}

// Graph problems are left to validation
TEST_CASE("Unknown dependency is not a parse error", "[parser]") {
    WorkflowParser parser;
    auto config = parser.parse_from_string(
        R"({"id": "x", "agents": [{"id": "a", "role": "worker", "depends_on": ["ghost"]}]})");
    REQUIRE(config.agents[0].depends_on == std::vector<NodeId>{"ghost"});
}

TEST_CASE("Parse from file", "[parser]") {
    auto path = std::filesystem::temp_directory_path() / "agentkernel_parser_test.yaml";
    {
        std::ofstream out(path);
        out << "id: from-file\nagents:\n  - id: only\n    role: worker\n";
    }

    WorkflowParser parser;
    auto config = parser.parse_from_file(path.string());
    REQUIRE(config.agents.size() == 1);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(parser.parse_from_file(path.string()), ConfigError);
}

TEST_CASE("YAML scalars keep their types", "[parser][yaml]") {
    auto j = yaml_to_json(YAML::Load("n: 42\nf: 0.5\nt: true\nq: \"42\"\nz: ~\nlist: [1, two]"));
    REQUIRE(j["n"] == 42);
    REQUIRE(j["f"] == 0.5);
    REQUIRE(j["t"] == true);
    REQUIRE(j["q"] == "42");
    REQUIRE(j["z"].is_null());
    REQUIRE(j["list"][1] == "two");
}
