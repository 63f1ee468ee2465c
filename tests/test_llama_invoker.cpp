// tests/test_llama_invoker.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/executor/llama_invoker.h"
#include <string>

using namespace agentkernel;

// Prompt composition and signature extraction need no loaded model
TEST_CASE("Prompt carries prior signatures and schema", "[llm]") {
    InvocationRequest request;
    request.run_id = "run-1";
    request.node.id = "report";
    request.node.role = AgentRole::WORKER;
    request.node.tools = {"web_search", "calculator"};
    request.node.output_schema = {{"type", "object"}};
    request.prompt = "Summarize the findings.";
    request.prior_signatures = {{"critique", "sig-c"}, {"search", "sig-s"}};

    auto prompt = LlamaInvoker::compose_prompt(request);

    REQUIRE(prompt.rfind("[CONTEXT CONTINUITY]\n", 0) == 0);
    REQUIRE(prompt.find("Previous Agent Signature (critique): sig-c") != std::string::npos);
    REQUIRE(prompt.find("Previous Agent Signature (search): sig-s") != std::string::npos);
    REQUIRE(prompt.find("Available tools: web_search calculator") != std::string::npos);
    REQUIRE(prompt.find("Summarize the findings.") != std::string::npos);
    REQUIRE(prompt.find("Respond with JSON") != std::string::npos);
}

TEST_CASE("Root node prompt has no continuity block", "[llm]") {
    InvocationRequest request;
    request.node.id = "plan";
    request.prompt = "Plan it.";
    auto prompt = LlamaInvoker::compose_prompt(request);
    REQUIRE(prompt.find("[CONTEXT CONTINUITY]") == std::string::npos);
    REQUIRE(prompt.find("Respond with JSON") == std::string::npos);
}

TEST_CASE("Signature is the tail of the generated text", "[llm]") {
    REQUIRE(LlamaInvoker::signature_from("short") == "short");
    std::string long_text(2000, 'x');
    long_text += "END";
    auto signature = LlamaInvoker::signature_from(long_text);
    REQUIRE(signature.size() == 512);
    REQUIRE(signature.substr(signature.size() - 3) == "END");
}

TEST_CASE("Missing model path is rejected before loading", "[llm]") {
    LlmConfig config;
    REQUIRE_THROWS_AS(LlamaInvoker(config), std::runtime_error);
}
