// modules/runtime/runtime_state_machine.cpp
#include "modules/runtime/runtime_state_machine.h"
#include "modules/budget/budget_controller.h"
#include "modules/trace/trace_exporter.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include <algorithm>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace agentkernel {

namespace {

constexpr size_t kNoInvocation = std::numeric_limits<size_t>::max();

struct NodeRecord {
    NodeStatus status = NodeStatus::PENDING;
    FailureKind failure = FailureKind::NONE;
    std::optional<std::string> error;
    uint64_t tokens_used = 0;
    nlohmann::json output = nullptr;
    std::chrono::steady_clock::time_point started;
    size_t invocation = kNoInvocation; // open InvocationRecord
};

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since)
        .count();
}

} // namespace

struct RuntimeStateMachine::RunState {
    RunState(RunId id, ExecutionPlanPtr p)
        : run_id(std::move(id)),
          plan(std::move(p)),
          nodes(plan->size()),
          budget(plan->max_token_budget(), plan->timeout_ms()) {}

    RunId run_id;
    ExecutionPlanPtr plan;
    mutable std::mutex mutex;
    RunStatus status = RunStatus::IDLE;
    std::vector<NodeRecord> nodes; // declaration index
    BudgetController budget;
    std::optional<std::string> started_at;
    std::optional<std::string> ended_at;
    std::vector<InvocationRecord> invocations;
};

// --- snapshot serialization ---

const NodeSnapshot* RunSnapshot::find_node(const NodeId& id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&id](const NodeSnapshot& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

void to_json(nlohmann::json& j, const InvocationRecord& record) {
    j = nlohmann::json{
        {"node_id", record.node_id},
        {"model", to_string(record.model)},
        {"status", to_string(record.status)},
        {"tokens_used", record.tokens_used},
        {"latency_ms", record.latency_ms},
        {"timestamp", record.timestamp}
    };
    if (record.error) {
        j["error"] = *record.error;
    }
}

void to_json(nlohmann::json& j, const NodeSnapshot& node) {
    j = nlohmann::json{
        {"id", node.id},
        {"status", node.blocked_by ? "blocked" : to_string(node.status)},
        {"tokens_used", node.tokens_used},
        {"output", node.output}
    };
    if (node.blocked_by) {
        j["blocked_by"] = *node.blocked_by;
    }
    if (node.failure != FailureKind::NONE) {
        j["failure_kind"] = to_string(node.failure);
    }
    if (node.error) {
        j["error"] = *node.error;
    }
}

void to_json(nlohmann::json& j, const RunSnapshot& snapshot) {
    nlohmann::json nodes = nlohmann::json::object();
    nlohmann::json order = nlohmann::json::array();
    for (const auto& node : snapshot.nodes) {
        nodes[node.id] = node;
        order.push_back(node.id);
    }
    j = nlohmann::json{
        {"run_id", snapshot.run_id},
        {"workflow_id", snapshot.workflow_id},
        {"status", to_string(snapshot.status)},
        {"started_at", snapshot.started_at ? nlohmann::json(*snapshot.started_at) : nlohmann::json(nullptr)},
        {"ended_at", snapshot.ended_at ? nlohmann::json(*snapshot.ended_at) : nlohmann::json(nullptr)},
        {"total_tokens_used", snapshot.total_tokens_used},
        {"max_token_budget", snapshot.max_token_budget},
        {"timeout_ms", snapshot.timeout_ms},
        {"order", std::move(order)},
        {"nodes", std::move(nodes)},
        {"invocations", snapshot.invocations}
    };
}

// --- RuntimeStateMachine ---

RuntimeStateMachine::RuntimeStateMachine(TraceExporter* trace) : trace_(trace) {}

RuntimeStateMachine::~RuntimeStateMachine() = default;

RuntimeStateMachine::RunStatePtr RuntimeStateMachine::find_run(const RunId& run_id) const {
    RunTable::const_accessor acc;
    if (!runs_.find(acc, run_id)) {
        throw RunNotFoundError(run_id);
    }
    return acc->second;
}

size_t RuntimeStateMachine::node_index_locked(const RunState& run, const NodeId& node_id) const {
    auto index = run.plan->find_index(node_id);
    if (!index) {
        throw NodeNotFoundError(run.run_id, node_id);
    }
    return *index;
}

bool RuntimeStateMachine::is_eligible(const RunState& run, size_t index) const {
    if (run.nodes[index].status != NodeStatus::PENDING) {
        return false;
    }
    const auto& deps = run.plan->dependency_indices(index);
    return std::all_of(deps.begin(), deps.end(),
                       [&run](size_t dep) { return run.nodes[dep].status == NodeStatus::COMPLETED; });
}

nlohmann::json RuntimeStateMachine::budget_json_locked(const RunState& run) const {
    return {
        {"tokens_used", run.budget.tokens_used()},
        {"max_tokens", run.budget.max_tokens()},
        {"invocations", run.budget.invocations()}
    };
}

RunSnapshot RuntimeStateMachine::create_run(ExecutionPlanPtr plan) {
    if (!plan) {
        throw std::invalid_argument("create_run: execution plan is null");
    }

    RunStatePtr run;
    for (;;) {
        RunTable::accessor acc;
        RunId run_id = generate_id("run");
        if (runs_.insert(acc, run_id)) {
            run = std::make_shared<RunState>(run_id, std::move(plan));
            acc->second = run;
            break;
        }
    }

    logger()->debug("Run {} created for workflow '{}' ({} nodes)", run->run_id, run->plan->workflow_id(),
                    run->plan->size());
    return snapshot(run->run_id);
}

void RuntimeStateMachine::start(const RunId& run_id) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    if (run->status != RunStatus::IDLE) {
        throw InvalidTransitionError(run_id, std::string("cannot start a run that is ") + to_string(run->status));
    }

    run->status = RunStatus::RUNNING;
    run->budget.start();
    run->started_at = now_rfc3339();
    logger()->info("Run {} started (workflow '{}', {} nodes)", run_id, run->plan->workflow_id(),
                   run->plan->size());
    if (trace_) {
        trace_->on_run_started(run_id, run->plan->workflow_id());
    }

    derive_status_locked(*run);
}

std::vector<NodeId> RuntimeStateMachine::eligible_nodes(const RunId& run_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    std::vector<NodeId> eligible;
    if (run->status != RunStatus::RUNNING) {
        return eligible;
    }
    for (size_t index : run->plan->topo_indices()) {
        if (is_eligible(*run, index)) {
            eligible.push_back(run->plan->node_at(index).id);
        }
    }
    return eligible;
}

void RuntimeStateMachine::begin_node(const RunId& run_id, const NodeId& node_id) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    size_t index = node_index_locked(*run, node_id);
    auto& node = run->nodes[index];

    if (run->status != RunStatus::RUNNING) {
        throw InvalidTransitionError(run_id, node_id, node.status, NodeStatus::RUNNING,
                                     std::string("run is ") + to_string(run->status));
    }
    if (node.status != NodeStatus::PENDING) {
        throw InvalidTransitionError(run_id, node_id, node.status, NodeStatus::RUNNING, "node is not pending");
    }
    if (!is_eligible(*run, index)) {
        throw InvalidTransitionError(run_id, node_id, node.status, NodeStatus::RUNNING,
                                     "dependencies are not all completed");
    }

    node.status = NodeStatus::RUNNING;
    node.started = std::chrono::steady_clock::now();
    node.invocation = run->invocations.size();
    run->invocations.push_back(InvocationRecord{
        .node_id = node_id,
        .model = run->plan->node_at(index).model,
        .status = NodeStatus::RUNNING,
        .timestamp = now_rfc3339(),
    });
    run->budget.count_invocation();

    logger()->debug("Run {}: node '{}' pending -> running", run_id, node_id);
    if (trace_) {
        trace_->on_node_start(run_id, node_id, budget_json_locked(*run));
    }
}

std::vector<NodeId> RuntimeStateMachine::begin_eligible_nodes(const RunId& run_id) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    std::vector<NodeId> claimed;
    if (run->status != RunStatus::RUNNING) {
        return claimed;
    }

    // Collect first: starting a node never makes another one eligible
    std::vector<size_t> ready;
    for (size_t index : run->plan->topo_indices()) {
        if (is_eligible(*run, index)) {
            ready.push_back(index);
        }
    }

    for (size_t index : ready) {
        const auto& agent = run->plan->node_at(index);
        auto& node = run->nodes[index];
        node.status = NodeStatus::RUNNING;
        node.started = std::chrono::steady_clock::now();
        node.invocation = run->invocations.size();
        run->invocations.push_back(InvocationRecord{
            .node_id = agent.id,
            .model = agent.model,
            .status = NodeStatus::RUNNING,
            .timestamp = now_rfc3339(),
        });
        run->budget.count_invocation();
        claimed.push_back(agent.id);

        logger()->debug("Run {}: node '{}' pending -> running", run_id, agent.id);
        if (trace_) {
            trace_->on_node_start(run_id, agent.id, budget_json_locked(*run));
        }
    }
    return claimed;
}

bool RuntimeStateMachine::complete_node(const RunId& run_id, const NodeId& node_id, uint64_t tokens_used,
                                        nlohmann::json output) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    size_t index = node_index_locked(*run, node_id);
    auto& node = run->nodes[index];

    if (node.status != NodeStatus::RUNNING) {
        throw InvalidTransitionError(run_id, node_id, node.status, NodeStatus::COMPLETED, "node is not running");
    }

    node.status = NodeStatus::COMPLETED;
    node.tokens_used = tokens_used;
    node.output = std::move(output);
    if (node.invocation != kNoInvocation) {
        auto& record = run->invocations[node.invocation];
        record.status = NodeStatus::COMPLETED;
        record.tokens_used = tokens_used;
        record.latency_ms = elapsed_ms(node.started);
        node.invocation = kNoInvocation;
    }

    bool within_budget = run->budget.try_consume_tokens(tokens_used);

    logger()->debug("Run {}: node '{}' running -> completed ({} tokens)", run_id, node_id, tokens_used);
    if (trace_) {
        trace_->on_node_end(run_id, node_id, true, std::nullopt, budget_json_locked(*run));
    }

    if (!within_budget) {
        terminate_over_budget_locked(*run);
    }

    derive_status_locked(*run);
    return within_budget;
}

bool RuntimeStateMachine::fail_node(const RunId& run_id, const NodeId& node_id, const std::string& error,
                                    FailureKind kind, uint64_t tokens_used) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    size_t index = node_index_locked(*run, node_id);
    auto& node = run->nodes[index];

    if (node.status != NodeStatus::RUNNING) {
        throw InvalidTransitionError(run_id, node_id, node.status, NodeStatus::FAILED, "node is not running");
    }

    node.status = NodeStatus::FAILED;
    node.failure = kind;
    node.error = error;
    node.tokens_used = tokens_used;
    if (node.invocation != kNoInvocation) {
        auto& record = run->invocations[node.invocation];
        record.status = NodeStatus::FAILED;
        record.tokens_used = tokens_used;
        record.latency_ms = elapsed_ms(node.started);
        record.error = error;
        node.invocation = kNoInvocation;
    }

    bool within_budget = tokens_used == 0 || run->budget.try_consume_tokens(tokens_used);

    logger()->warn("Run {}: node '{}' failed ({}): {}", run_id, node_id, to_string(kind), error);
    if (trace_) {
        trace_->on_node_end(run_id, node_id, false, error, budget_json_locked(*run));
    }

    if (!within_budget) {
        terminate_over_budget_locked(*run);
    }

    derive_status_locked(*run);
    return within_budget;
}

void RuntimeStateMachine::terminate_over_budget_locked(RunState& run) {
    std::string detail = "token budget exceeded: " + std::to_string(run.budget.tokens_used()) + " > " +
                         std::to_string(run.budget.max_tokens());
    logger()->warn("Run {}: {}", run.run_id, detail);
    force_fail_locked(run, FailureKind::BUDGET_EXCEEDED, detail);
}

void RuntimeStateMachine::force_fail_locked(RunState& run, FailureKind kind, const std::string& detail) {
    if (trace_) {
        trace_->on_intervention(run.run_id, to_string(kind), detail);
    }
    for (size_t index : run.plan->topo_indices()) {
        auto& node = run.nodes[index];
        if (is_terminal(node.status)) {
            continue;
        }
        node.status = NodeStatus::FAILED;
        node.failure = kind;
        node.error = detail;
        if (node.invocation != kNoInvocation) {
            auto& record = run.invocations[node.invocation];
            record.status = NodeStatus::FAILED;
            record.latency_ms = elapsed_ms(node.started);
            record.error = detail;
            node.invocation = kNoInvocation;
        }
        if (trace_) {
            trace_->on_node_end(run.run_id, run.plan->node_at(index).id, false, detail, budget_json_locked(run));
        }
    }
}

void RuntimeStateMachine::derive_status_locked(RunState& run) {
    if (run.status != RunStatus::RUNNING) {
        return;
    }

    bool all_completed = true;
    for (size_t i = 0; i < run.nodes.size(); ++i) {
        const auto& node = run.nodes[i];
        if (node.status == NodeStatus::RUNNING || is_eligible(run, i)) {
            return; // progress still possible
        }
        if (node.status != NodeStatus::COMPLETED) {
            all_completed = false;
        }
    }

    run.status = all_completed ? RunStatus::COMPLETED : RunStatus::FAILED;
    run.ended_at = now_rfc3339();

    logger()->info("Run {} {} ({} tokens, {} invocations)", run.run_id, to_string(run.status),
                   run.budget.tokens_used(), run.budget.invocations());
    if (trace_) {
        trace_->on_run_end(run.run_id, all_completed,
                           {{"status", to_string(run.status)}, {"budget", budget_json_locked(run)}});
    }
}

bool RuntimeStateMachine::terminate_run(const RunId& run_id, FailureKind kind, const std::string& detail) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    if (run->status != RunStatus::RUNNING) {
        return false;
    }
    logger()->warn("Run {} terminated ({}): {}", run_id, to_string(kind), detail);
    force_fail_locked(*run, kind, detail);
    derive_status_locked(*run);
    return true;
}

bool RuntimeStateMachine::expire_if_overdue(const RunId& run_id, std::chrono::steady_clock::time_point now) {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    if (run->status != RunStatus::RUNNING || !run->budget.expired(now)) {
        return false;
    }
    std::string detail = "run exceeded timeout of " + std::to_string(run->budget.timeout_ms()) + "ms";
    logger()->warn("Run {}: {}", run_id, detail);
    force_fail_locked(*run, FailureKind::TIMEOUT, detail);
    derive_status_locked(*run);
    return true;
}

std::optional<std::chrono::steady_clock::time_point> RuntimeStateMachine::deadline(const RunId& run_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);
    return run->budget.deadline();
}

RunStatus RuntimeStateMachine::status(const RunId& run_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);
    return run->status;
}

NodeStatus RuntimeStateMachine::node_status(const RunId& run_id, const NodeId& node_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);
    return run->nodes[node_index_locked(*run, node_id)].status;
}

ExecutionPlanPtr RuntimeStateMachine::plan(const RunId& run_id) const {
    // plan is immutable after creation
    return find_run(run_id)->plan;
}

RunSnapshot RuntimeStateMachine::snapshot(const RunId& run_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);
    const auto& plan = *run->plan;

    RunSnapshot snap;
    snap.run_id = run->run_id;
    snap.workflow_id = plan.workflow_id();
    snap.status = run->status;
    snap.started_at = run->started_at;
    snap.ended_at = run->ended_at;
    snap.total_tokens_used = run->budget.tokens_used();
    snap.max_token_budget = plan.max_token_budget();
    snap.timeout_ms = plan.timeout_ms();
    snap.invocations = run->invocations;

    // topological position of each node, used to pick the earliest failed ancestor
    const auto& topo = plan.topo_indices();
    std::vector<size_t> position(plan.size());
    for (size_t pos = 0; pos < topo.size(); ++pos) {
        position[topo[pos]] = pos;
    }

    // blocked_root[i]: failed ancestor that blocks Pending node i
    std::vector<std::optional<size_t>> blocked_root(plan.size());
    snap.nodes.reserve(plan.size());
    for (size_t index : topo) {
        const auto& record = run->nodes[index];
        if (record.status == NodeStatus::PENDING) {
            for (size_t dep : plan.dependency_indices(index)) {
                std::optional<size_t> root;
                if (run->nodes[dep].status == NodeStatus::FAILED) {
                    root = dep;
                } else {
                    root = blocked_root[dep];
                }
                if (root && (!blocked_root[index] || position[*root] < position[*blocked_root[index]])) {
                    blocked_root[index] = root;
                }
            }
        }

        NodeSnapshot node;
        node.id = plan.node_at(index).id;
        node.status = record.status;
        if (blocked_root[index]) {
            node.blocked_by = plan.node_at(*blocked_root[index]).id;
        }
        node.failure = record.failure;
        node.error = record.error;
        node.tokens_used = record.tokens_used;
        node.output = record.output;
        snap.nodes.push_back(std::move(node));
    }
    return snap;
}

std::map<NodeId, nlohmann::json> RuntimeStateMachine::dependency_outputs(const RunId& run_id,
                                                                         const NodeId& node_id) const {
    auto run = find_run(run_id);
    std::lock_guard lock(run->mutex);

    std::map<NodeId, nlohmann::json> outputs;
    size_t index = node_index_locked(*run, node_id);
    for (size_t dep : run->plan->dependency_indices(index)) {
        if (run->nodes[dep].status == NodeStatus::COMPLETED) {
            outputs.emplace(run->plan->node_at(dep).id, run->nodes[dep].output);
        }
    }
    return outputs;
}

void RuntimeStateMachine::discard(const RunId& run_id) {
    RunTable::accessor acc;
    if (!runs_.find(acc, run_id)) {
        throw RunNotFoundError(run_id);
    }
    {
        std::lock_guard lock(acc->second->mutex);
        if (acc->second->status == RunStatus::RUNNING) {
            throw InvalidTransitionError(run_id, "cannot discard a running run");
        }
    }
    runs_.erase(acc);
    logger()->debug("Run {} discarded", run_id);
}

bool RuntimeStateMachine::contains(const RunId& run_id) const {
    RunTable::const_accessor acc;
    return runs_.find(acc, run_id);
}

} // namespace agentkernel
