// tests/test_trace_exporter.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/trace/trace_exporter.h"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agentkernel;

TEST_CASE("Events are stored per run in recording order", "[trace]") {
    TraceExporter trace;
    trace.on_run_started("run-1", "wf");
    trace.on_node_start("run-1", "A", {{"tokens_used", 0}});
    trace.on_run_started("run-2", "wf");
    trace.on_node_end("run-1", "A", false, std::string("boom"), {{"tokens_used", 3}});

    auto events = trace.get_events("run-1");
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].type == EventType::RUN_STARTED);
    REQUIRE(events[1].node_id == std::optional<NodeId>("A"));
    REQUIRE(events[2].type == EventType::NODE_FAILED);
    REQUIRE(events[2].payload["error"] == "boom");
    REQUIRE(events[0].sequence < events[1].sequence);
    REQUIRE(events[1].sequence < events[2].sequence);
    REQUIRE(trace.get_events("run-2").size() == 1);
    REQUIRE(trace.get_events("run-unknown").empty());

    nlohmann::json j = events[2];
    REQUIRE(j["type"] == "node_failed");
    REQUIRE(j["run_id"] == "run-1");
    REQUIRE(j["node_id"] == "A");
    REQUIRE_FALSE(j["timestamp"].get<std::string>().empty());
}

TEST_CASE("Listeners receive events until unsubscribed", "[trace]") {
    TraceExporter trace;
    std::vector<EventType> seen;
    auto id = trace.subscribe([&seen](const RuntimeEvent& event) { seen.push_back(event.type); });

    trace.on_run_started("run-1", "wf");
    trace.on_intervention("run-1", "timeout", "run exceeded timeout of 10ms");
    REQUIRE(trace.unsubscribe(id));
    REQUIRE_FALSE(trace.unsubscribe(id));
    trace.on_run_end("run-1", false, {{"status", "failed"}});

    REQUIRE(seen == std::vector<EventType>{EventType::RUN_STARTED, EventType::SYSTEM_INTERVENTION});
    REQUIRE(trace.get_events("run-1").size() == 3);
}

TEST_CASE("A throwing listener does not break recording", "[trace]") {
    TraceExporter trace;
    int calls = 0;
    trace.subscribe([](const RuntimeEvent&) { throw std::runtime_error("listener failed"); });
    trace.subscribe([&calls](const RuntimeEvent&) { ++calls; });

    REQUIRE_NOTHROW(trace.on_run_started("run-1", "wf"));
    REQUIRE(calls == 1);
    REQUIRE(trace.get_events("run-1").size() == 1);
}

TEST_CASE("Clear forgets one run", "[trace]") {
    TraceExporter trace;
    trace.on_run_started("run-1", "wf");
    trace.on_run_started("run-2", "wf");
    trace.clear("run-1");
    REQUIRE(trace.get_events("run-1").empty());
    REQUIRE(trace.get_events("run-2").size() == 1);
}

TEST_CASE("Concurrent recording keeps per-run order", "[trace][concurrency]") {
    TraceExporter trace;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&trace, t] {
            RunId run = "run-" + std::to_string(t);
            for (int i = 0; i < 250; ++i) {
                trace.record(run, EventType::NODE_STARTED, "n" + std::to_string(i));
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int t = 0; t < 4; ++t) {
        auto events = trace.get_events("run-" + std::to_string(t));
        REQUIRE(events.size() == 250);
        for (size_t i = 1; i < events.size(); ++i) {
            REQUIRE(events[i - 1].sequence < events[i].sequence);
            REQUIRE(events[i].node_id == std::optional<NodeId>("n" + std::to_string(i)));
        }
    }
}
