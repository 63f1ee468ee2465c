// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include <algorithm>
#include <mutex>

namespace agentkernel {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::RUN_STARTED: return "run_started";
        case EventType::NODE_STARTED: return "node_started";
        case EventType::NODE_COMPLETED: return "node_completed";
        case EventType::NODE_FAILED: return "node_failed";
        case EventType::RUN_COMPLETED: return "run_completed";
        case EventType::RUN_FAILED: return "run_failed";
        case EventType::SYSTEM_INTERVENTION: return "system_intervention";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const RuntimeEvent& event) {
    j = nlohmann::json{
        {"id", event.id},
        {"sequence", event.sequence},
        {"run_id", event.run_id},
        {"type", to_string(event.type)},
        {"timestamp", event.timestamp},
        {"payload", event.payload}
    };
    if (event.node_id) {
        j["node_id"] = *event.node_id;
    }
}

RuntimeEvent TraceExporter::record(const RunId& run_id, EventType type,
                                   std::optional<NodeId> node_id, nlohmann::json payload) {
    RuntimeEvent event;
    event.id = generate_id("evt", 12);
    event.run_id = run_id;
    event.type = type;
    event.node_id = std::move(node_id);
    event.timestamp = now_rfc3339();
    event.payload = std::move(payload);

    {
        EventLog::accessor acc;
        events_.insert(acc, run_id);
        // numbered under the run's bucket lock so each log stays sorted
        event.sequence = next_sequence_.fetch_add(1);
        acc->second.push_back(event);
    }

    std::shared_lock lock(listeners_mutex_);
    for (const auto& [id, listener] : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            logger()->warn("Event listener {} threw on {}: {}", id, to_string(type), e.what());
        }
    }
    return event;
}

void TraceExporter::on_run_started(const RunId& run_id, const std::string& workflow_id) {
    record(run_id, EventType::RUN_STARTED, std::nullopt, {{"workflow_id", workflow_id}});
}

void TraceExporter::on_node_start(const RunId& run_id, const NodeId& node_id,
                                  const nlohmann::json& budget_snapshot) {
    record(run_id, EventType::NODE_STARTED, node_id, {{"budget", budget_snapshot}});
}

void TraceExporter::on_node_end(const RunId& run_id, const NodeId& node_id, bool success,
                                const std::optional<std::string>& error,
                                const nlohmann::json& budget_snapshot) {
    nlohmann::json payload{{"budget", budget_snapshot}};
    if (error) {
        payload["error"] = *error;
    }
    record(run_id, success ? EventType::NODE_COMPLETED : EventType::NODE_FAILED, node_id,
           std::move(payload));
}

void TraceExporter::on_run_end(const RunId& run_id, bool success, const nlohmann::json& summary) {
    record(run_id, success ? EventType::RUN_COMPLETED : EventType::RUN_FAILED, std::nullopt, summary);
}

void TraceExporter::on_intervention(const RunId& run_id, const std::string& reason,
                                    const std::string& detail) {
    record(run_id, EventType::SYSTEM_INTERVENTION, std::nullopt,
           {{"reason", reason}, {"detail", detail}});
}

std::vector<RuntimeEvent> TraceExporter::get_events(const RunId& run_id) const {
    EventLog::const_accessor acc;
    if (!events_.find(acc, run_id)) {
        return {};
    }
    return acc->second;
}

uint64_t TraceExporter::subscribe(Listener listener) {
    std::unique_lock lock(listeners_mutex_);
    uint64_t id = next_subscription_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool TraceExporter::unsubscribe(uint64_t subscription_id) {
    std::unique_lock lock(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [subscription_id](const auto& entry) { return entry.first == subscription_id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void TraceExporter::clear(const RunId& run_id) {
    events_.erase(run_id);
}

} // namespace agentkernel
