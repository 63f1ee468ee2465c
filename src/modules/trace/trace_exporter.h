// modules/trace/trace_exporter.h
#ifndef AGENTKERNEL_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTKERNEL_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/node.h" // 引入 RunId, NodeId
#include <nlohmann/json.hpp>
#include <tbb/concurrent_hash_map.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace agentkernel {

enum class EventType : uint8_t {
    RUN_STARTED,
    NODE_STARTED,
    NODE_COMPLETED,
    NODE_FAILED,
    RUN_COMPLETED,
    RUN_FAILED,
    SYSTEM_INTERVENTION // timeout, stop, budget
};

const char* to_string(EventType type);

struct RuntimeEvent {
    std::string id;
    uint64_t sequence = 0; // global, strictly increasing
    RunId run_id;
    EventType type = EventType::RUN_STARTED;
    std::optional<NodeId> node_id;
    std::string timestamp; // RFC 3339
    nlohmann::json payload = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const RuntimeEvent& event);

// Per-run lifecycle event log with live listeners.
//
// Listeners are called synchronously on the recording thread, after the event
// is stored. A listener must not call subscribe()/unsubscribe().
class TraceExporter {
public:
    using Listener = std::function<void(const RuntimeEvent&)>;

    // Fills id, sequence and timestamp, stores the event and notifies listeners
    RuntimeEvent record(const RunId& run_id, EventType type,
                        std::optional<NodeId> node_id = std::nullopt,
                        nlohmann::json payload = nlohmann::json::object());

    void on_run_started(const RunId& run_id, const std::string& workflow_id);
    void on_node_start(const RunId& run_id, const NodeId& node_id, const nlohmann::json& budget_snapshot);
    void on_node_end(const RunId& run_id, const NodeId& node_id, bool success,
                     const std::optional<std::string>& error, const nlohmann::json& budget_snapshot);
    void on_run_end(const RunId& run_id, bool success, const nlohmann::json& summary);
    void on_intervention(const RunId& run_id, const std::string& reason, const std::string& detail);

    // Events of one run in recording order; empty for unknown runs
    std::vector<RuntimeEvent> get_events(const RunId& run_id) const;

    uint64_t subscribe(Listener listener);
    bool unsubscribe(uint64_t subscription_id);

    void clear(const RunId& run_id);

private:
    using EventLog = tbb::concurrent_hash_map<RunId, std::vector<RuntimeEvent>>;

    EventLog events_;
    std::atomic<uint64_t> next_sequence_{1};

    mutable std::shared_mutex listeners_mutex_;
    std::vector<std::pair<uint64_t, Listener>> listeners_;
    uint64_t next_subscription_ = 1;
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_TRACE_TRACE_EXPORTER_H
