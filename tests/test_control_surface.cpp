// tests/test_control_surface.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/control/control_surface.h"
#include "core/kernel.h"
#include "support/scripted_invoker.h"
#include <chrono>
#include <memory>
#include <string>

using namespace agentkernel;
using namespace std::chrono_literals;
using agentkernel::testing::Script;
using agentkernel::testing::ScriptedInvoker;

namespace {

struct Fixture {
    Fixture() {
        auto scripted = std::make_unique<ScriptedInvoker>();
        invoker = scripted.get();
        KernelConfig config;
        config.max_concurrency = 4;
        config.log_level = "warn";
        kernel = std::make_unique<Kernel>(std::move(scripted), config);
        control = std::make_unique<ControlSurface>(*kernel);
    }

    RunId start(const std::string& body) {
        auto response = control->handle("POST", "/runtime/start", body);
        REQUIRE(response.status == 201);
        return response.body["run_id"].get<std::string>();
    }

    ScriptedInvoker* invoker = nullptr;
    std::unique_ptr<Kernel> kernel;
    std::unique_ptr<ControlSurface> control;
};

const char* kChain = R"({
    "id": "chain",
    "agents": [
        {"id": "A", "role": "orchestrator", "prompt": "start"},
        {"id": "B", "role": "worker", "depends_on": ["A"], "prompt": "continue"}
    ]
})";

} // namespace

TEST_CASE("Health check", "[control]") {
    Fixture f;
    auto response = f.control->handle("GET", "/health");
    REQUIRE(response.status == 200);
    REQUIRE(response.body["status"] == "ok");
}

// Test 2: start, wait, then read state and signatures back
TEST_CASE("Start a run and read its state", "[control]") {
    Fixture f;
    auto run_id = f.start(kChain);
    REQUIRE(f.kernel->wait(run_id, 10s) == RunStatus::COMPLETED);

    auto state = f.control->handle("GET", "/runtime/state?run_id=" + run_id);
    REQUIRE(state.status == 200);
    REQUIRE(state.body["status"] == "completed");
    REQUIRE(state.body["workflow_id"] == "chain");
    REQUIRE(state.body["nodes"]["B"]["status"] == "completed");
    REQUIRE(state.body["order"] == nlohmann::json::array({"A", "B"}));

    auto signatures = f.control->handle("GET", "/runtime/signatures?run_id=" + run_id);
    REQUIRE(signatures.status == 200);
    REQUIRE(signatures.body["signatures"]["A"] == "sig-A");
    REQUIRE(signatures.body["signatures"]["B"] == "sig-B");

    auto topology = f.control->handle("GET", "/runtime/topology?run_id=" + run_id);
    REQUIRE(topology.status == 200);
    REQUIRE(topology.body["edges"].size() == 1);
    REQUIRE(topology.body["edges"][0]["from"] == "A");
    REQUIRE(topology.body["edges"][0]["to"] == "B");

    auto events = f.control->handle("GET", "/runtime/events?run_id=" + run_id);
    REQUIRE(events.status == 200);
    REQUIRE(events.body["events"].front()["type"] == "run_started");
    REQUIRE(events.body["events"].back()["type"] == "run_completed");
}

TEST_CASE("Invalid workflows are rejected with detail", "[control]") {
    Fixture f;

    SECTION("cycle") {
        auto response = f.control->handle("POST", "/runtime/start", R"({
            "id": "loop",
            "agents": [
                {"id": "a", "role": "worker", "depends_on": ["b"]},
                {"id": "b", "role": "worker", "depends_on": ["a"]}
            ]
        })");
        REQUIRE(response.status == 400);
        REQUIRE(response.body["error"]["kind"] == "CycleDetected");
        REQUIRE(response.body["error"]["cycle"].size() == 2);
    }

    SECTION("unknown dependency") {
        auto response = f.control->handle("POST", "/runtime/start", R"({
            "id": "dangling",
            "agents": [{"id": "a", "role": "worker", "depends_on": ["ghost"]}]
        })");
        REQUIRE(response.status == 400);
        REQUIRE(response.body["error"]["kind"] == "UnknownDependency");
        REQUIRE(response.body["error"]["node"] == "a");
        REQUIRE(response.body["error"]["edge"]["from"] == "ghost");
        REQUIRE(response.body["error"]["edge"]["to"] == "a");
    }

    SECTION("config error") {
        auto response = f.control->handle("POST", "/runtime/start", R"({"id": "x"})");
        REQUIRE(response.status == 400);
        REQUIRE(response.body["error"]["kind"] == "ConfigError");
    }

    SECTION("not JSON") {
        auto response = f.control->handle("POST", "/runtime/start", "{not json");
        REQUIRE(response.status == 400);
        REQUIRE(response.body["error"]["kind"] == "BadRequest");
    }
}

TEST_CASE("Unknown runs and missing parameters", "[control]") {
    Fixture f;
    REQUIRE(f.control->handle("GET", "/runtime/state").status == 400);
    REQUIRE(f.control->handle("GET", "/runtime/state?run_id=").status == 400);

    auto state = f.control->handle("GET", "/runtime/state?run_id=run-missing");
    REQUIRE(state.status == 404);
    REQUIRE(state.body["error"]["kind"] == "RunNotFound");

    REQUIRE(f.control->handle("GET", "/runtime/signatures?run_id=run-missing").status == 404);
    REQUIRE(f.control->handle("GET", "/runtime/events?run_id=run-missing").status == 404);
    REQUIRE(f.control->handle("GET", "/runtime/topology?run_id=run-missing").status == 404);
    REQUIRE(f.control->handle("POST", "/runtime/run-missing/stop").status == 404);
    REQUIRE(f.control->handle("DELETE", "/runtime/run-missing").status == 404);
    REQUIRE(f.control->handle("POST", "/runtime/agent/A/invoke?run_id=run-missing").status == 404);
}

TEST_CASE("Routing rejects unknown paths and wrong methods", "[control]") {
    Fixture f;
    REQUIRE(f.control->handle("GET", "/nowhere").status == 404);
    REQUIRE(f.control->handle("GET", "/runtime/a/b/c/d/e").status == 404);
    REQUIRE(f.control->handle("GET", "/runtime/start").status == 405);
    REQUIRE(f.control->handle("POST", "/runtime/state?run_id=x").status == 405);
    REQUIRE(f.control->handle("GET", "/runtime/agent/A/invoke?run_id=x").status == 405);
}

TEST_CASE("Manual invocation through the control surface", "[control][manual]") {
    Fixture f;
    std::string body = std::string(R"({"dispatch": "manual", "workflow": )") + kChain + "}";
    auto start = f.control->handle("POST", "/runtime/start", body);
    REQUIRE(start.status == 201);
    REQUIRE(start.body["dispatch"] == "manual");
    RunId run_id = start.body["run_id"];

    auto early = f.control->handle("POST", "/runtime/agent/B/invoke?run_id=" + run_id);
    REQUIRE(early.status == 409);
    REQUIRE(early.body["error"]["kind"] == "InvalidTransition");
    REQUIRE(early.body["error"]["node"] == "B");
    REQUIRE(early.body["error"]["current"] == "pending");

    auto missing = f.control->handle("POST", "/runtime/agent/Z/invoke?run_id=" + run_id);
    REQUIRE(missing.status == 404);
    REQUIRE(missing.body["error"]["kind"] == "NodeNotFound");

    auto a = f.control->handle("POST", "/runtime/agent/A/invoke?run_id=" + run_id);
    REQUIRE(a.status == 200);
    REQUIRE(a.body["node"]["status"] == "completed");
    REQUIRE(a.body["input"]["prompt"] == "start");

    auto again = f.control->handle("POST", "/runtime/agent/A/invoke?run_id=" + run_id);
    REQUIRE(again.status == 409);
    REQUIRE(again.body["error"]["current"] == "completed");

    auto b = f.control->handle("POST", "/runtime/agent/B/invoke?run_id=" + run_id);
    REQUIRE(b.status == 200);
    REQUIRE(b.body["input"]["prior_signatures"]["A"] == "sig-A");

    auto state = f.control->get_state(run_id);
    REQUIRE(state.body["status"] == "completed");
}

TEST_CASE("Unknown dispatch mode is a bad request", "[control][manual]") {
    Fixture f;
    auto response = f.control->start_workflow(nlohmann::json{{"dispatch", "eager"}, {"id", "x"}, {"agents", nlohmann::json::array()}});
    REQUIRE(response.status == 400);
    REQUIRE(response.body["error"]["kind"] == "ConfigError");
}

TEST_CASE("Stop and discard", "[control]") {
    Fixture f;
    f.invoker->script("A", Script{.wait_for_cancel = true});
    auto run_id = f.start(kChain);

    auto refused = f.control->handle("DELETE", "/runtime/" + run_id);
    REQUIRE(refused.status == 409);

    auto stopped = f.control->handle("POST", "/runtime/" + run_id + "/stop");
    REQUIRE(stopped.status == 200);
    REQUIRE(stopped.body["status"] == "failed");
    REQUIRE(stopped.body["stopped"] == true);
    REQUIRE(stopped.body["nodes"]["B"]["failure_kind"] == "cancelled");

    REQUIRE(f.kernel->wait(run_id, 10s) == RunStatus::FAILED);
    auto again = f.control->stop_run(run_id);
    REQUIRE(again.status == 200);
    REQUIRE(again.body["stopped"] == false);

    auto discarded = f.control->handle("DELETE", "/runtime/" + run_id);
    REQUIRE(discarded.status == 204);
    REQUIRE(f.control->get_state(run_id).status == 404);
    REQUIRE(f.kernel->trace().get_events(run_id).empty());
}

TEST_CASE("Query strings are percent-decoded", "[control]") {
    auto params = parse_query("run_id=run-1%2Fx&flag&name=a+b");
    REQUIRE(params.at("run_id") == "run-1/x");
    REQUIRE(params.at("flag").empty());
    REQUIRE(params.at("name") == "a b");
}
