// modules/runtime/runtime_state_machine.h
#ifndef AGENTKERNEL_MODULES_RUNTIME_RUNTIME_STATE_MACHINE_H
#define AGENTKERNEL_MODULES_RUNTIME_RUNTIME_STATE_MACHINE_H

#include "core/types/node.h"
#include "core/types/plan.h"
#include "core/types/status.h"
#include <nlohmann/json.hpp>
#include <tbb/concurrent_hash_map.h>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentkernel {

class TraceExporter;

// One entry per begin_node, closed by complete/fail
struct InvocationRecord {
    NodeId node_id;
    ModelVariant model = ModelVariant::FAST;
    NodeStatus status = NodeStatus::RUNNING;
    uint64_t tokens_used = 0;
    int64_t latency_ms = 0;
    std::string timestamp; // begin time, RFC 3339
    std::optional<std::string> error;
};

struct NodeSnapshot {
    NodeId id;
    NodeStatus status = NodeStatus::PENDING;
    std::optional<NodeId> blocked_by; // set for a Pending node with a Failed ancestor
    FailureKind failure = FailureKind::NONE;
    std::optional<std::string> error;
    uint64_t tokens_used = 0;
    nlohmann::json output = nullptr;
};

struct RunSnapshot {
    RunId run_id;
    std::string workflow_id;
    RunStatus status = RunStatus::IDLE;
    std::optional<std::string> started_at;
    std::optional<std::string> ended_at;
    uint64_t total_tokens_used = 0;
    uint64_t max_token_budget = 0;
    uint64_t timeout_ms = 0;
    std::vector<NodeSnapshot> nodes; // topological order
    std::vector<InvocationRecord> invocations;

    const NodeSnapshot* find_node(const NodeId& id) const;
};

void to_json(nlohmann::json& j, const InvocationRecord& record);
void to_json(nlohmann::json& j, const NodeSnapshot& node);
void to_json(nlohmann::json& j, const RunSnapshot& snapshot);

// Sole owner of run and node status.
//
// Each run has its own lock; runs never contend with each other. Every rejected
// transition throws InvalidTransitionError and leaves the run untouched.
// Events go to the TraceExporter while the run lock is held, so listeners see
// them in transition order and must not call back into this object.
class RuntimeStateMachine {
public:
    explicit RuntimeStateMachine(TraceExporter* trace = nullptr);
    ~RuntimeStateMachine();

    RuntimeStateMachine(const RuntimeStateMachine&) = delete;
    RuntimeStateMachine& operator=(const RuntimeStateMachine&) = delete;

    // New run, status Idle, every node Pending
    RunSnapshot create_run(ExecutionPlanPtr plan);

    // Idle -> Running. Throws RunNotFoundError, InvalidTransitionError if not Idle.
    // An empty plan completes immediately.
    void start(const RunId& run_id);

    // Pending nodes whose dependencies are all Completed, in topological order.
    // Empty unless the run is Running.
    std::vector<NodeId> eligible_nodes(const RunId& run_id) const;

    // Pending -> Running (node must be eligible)
    void begin_node(const RunId& run_id, const NodeId& node_id);

    // Claims every currently eligible node at once; used by the dispatcher
    std::vector<NodeId> begin_eligible_nodes(const RunId& run_id);

    // Running -> Completed. Returns false when the charged tokens pushed the run
    // over its budget; the run is then terminated with BUDGET_EXCEEDED.
    bool complete_node(const RunId& run_id, const NodeId& node_id, uint64_t tokens_used,
                       nlohmann::json output = nullptr);

    // Running -> Failed. Tokens spent by the failed call are charged like in
    // complete_node; returns false when they pushed the run over its budget.
    bool fail_node(const RunId& run_id, const NodeId& node_id, const std::string& error,
                   FailureKind kind = FailureKind::INVOCATION_ERROR, uint64_t tokens_used = 0);

    // Force-fails every Pending/Running node with `kind`, run -> Failed.
    // Returns false (no-op) when the run is not Running.
    bool terminate_run(const RunId& run_id, FailureKind kind, const std::string& detail);

    // Terminates with TIMEOUT if the run's deadline has passed
    bool expire_if_overdue(const RunId& run_id,
                           std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // nullopt for runs without a timeout or not yet started
    std::optional<std::chrono::steady_clock::time_point> deadline(const RunId& run_id) const;

    RunStatus status(const RunId& run_id) const;
    NodeStatus node_status(const RunId& run_id, const NodeId& node_id) const;
    RunSnapshot snapshot(const RunId& run_id) const;
    ExecutionPlanPtr plan(const RunId& run_id) const;

    // dependency id -> output of each Completed direct dependency
    std::map<NodeId, nlohmann::json> dependency_outputs(const RunId& run_id, const NodeId& node_id) const;

    // Forgets the run. Throws InvalidTransitionError while it is Running.
    void discard(const RunId& run_id);

    bool contains(const RunId& run_id) const;

private:
    struct RunState;
    using RunStatePtr = std::shared_ptr<RunState>;
    using RunTable = tbb::concurrent_hash_map<RunId, RunStatePtr>;

    RunStatePtr find_run(const RunId& run_id) const; // throws RunNotFoundError

    // The helpers below expect the run lock to be held
    bool is_eligible(const RunState& run, size_t index) const;
    void force_fail_locked(RunState& run, FailureKind kind, const std::string& detail);
    void terminate_over_budget_locked(RunState& run);
    void derive_status_locked(RunState& run);
    size_t node_index_locked(const RunState& run, const NodeId& node_id) const;
    nlohmann::json budget_json_locked(const RunState& run) const;

    TraceExporter* trace_;
    RunTable runs_;
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_RUNTIME_RUNTIME_STATE_MACHINE_H
