// core/types/plan.cpp
#include "core/types/plan.h"
#include <stdexcept>

namespace agentkernel {

ExecutionPlan::ExecutionPlan(WorkflowConfig config,
                             std::vector<std::vector<size_t>> dependencies,
                             std::vector<size_t> topo_order)
    : config_(std::move(config)),
      dependencies_(std::move(dependencies)),
      dependents_(config_.agents.size()),
      topo_order_(std::move(topo_order)) {
    for (size_t i = 0; i < config_.agents.size(); ++i) {
        index_.emplace(config_.agents[i].id, i);
    }
    for (size_t i = 0; i < dependencies_.size(); ++i) {
        for (size_t dep : dependencies_[i]) {
            dependents_[dep].push_back(i);
        }
    }
    order_ids_.reserve(topo_order_.size());
    for (size_t idx : topo_order_) {
        order_ids_.push_back(config_.agents[idx].id);
    }
}

std::optional<size_t> ExecutionPlan::find_index(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ExecutionPlan::index_of(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Node not in plan: " + id);
    }
    return it->second;
}

const AgentNode& ExecutionPlan::node(const NodeId& id) const {
    return config_.agents[index_of(id)];
}

std::vector<NodeId> ExecutionPlan::dependencies(const NodeId& id) const {
    std::vector<NodeId> ids;
    for (size_t dep : dependencies_[index_of(id)]) {
        ids.push_back(config_.agents[dep].id);
    }
    return ids;
}

std::vector<NodeId> ExecutionPlan::dependents(const NodeId& id) const {
    std::vector<NodeId> ids;
    for (size_t child : dependents_[index_of(id)]) {
        ids.push_back(config_.agents[child].id);
    }
    return ids;
}

} // namespace agentkernel
