#ifndef AGENTKERNEL_CORE_TYPES_PLAN_H
#define AGENTKERNEL_CORE_TYPES_PLAN_H

#include "core/types/node.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace agentkernel {

// Immutable result of a successful validate(). Nodes are stored in declaration
// order; order() is the deterministic topological order.
class ExecutionPlan {
public:
    ExecutionPlan(WorkflowConfig config,
                  std::vector<std::vector<size_t>> dependencies,
                  std::vector<size_t> topo_order);

    ExecutionPlan(const ExecutionPlan&) = delete;
    ExecutionPlan& operator=(const ExecutionPlan&) = delete;

    const std::string& workflow_id() const { return config_.id; }
    const WorkflowConfig& config() const { return config_; }
    uint64_t max_token_budget() const { return config_.max_token_budget; }
    uint64_t timeout_ms() const { return config_.timeout_ms; }

    size_t size() const { return config_.agents.size(); }
    bool contains(const NodeId& id) const { return index_.count(id) > 0; }
    std::optional<size_t> find_index(const NodeId& id) const;

    // Index-based accessors (declaration index)
    const AgentNode& node_at(size_t index) const { return config_.agents[index]; }
    const std::vector<size_t>& dependency_indices(size_t index) const { return dependencies_[index]; }
    const std::vector<size_t>& dependent_indices(size_t index) const { return dependents_[index]; }
    const std::vector<size_t>& topo_indices() const { return topo_order_; }

    // Id-based accessors, throw std::out_of_range for unknown ids
    const AgentNode& node(const NodeId& id) const;
    std::vector<NodeId> dependencies(const NodeId& id) const;
    std::vector<NodeId> dependents(const NodeId& id) const;

    // Topologically ordered node ids
    const std::vector<NodeId>& order() const { return order_ids_; }

private:
    size_t index_of(const NodeId& id) const;

    WorkflowConfig config_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<std::vector<size_t>> dependencies_; // 前驱 (deduplicated, declaration order)
    std::vector<std::vector<size_t>> dependents_;   // 后继
    std::vector<size_t> topo_order_;
    std::vector<NodeId> order_ids_;
};

using ExecutionPlanPtr = std::shared_ptr<const ExecutionPlan>;

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_TYPES_PLAN_H
