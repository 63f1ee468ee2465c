// modules/graph/dag_validator.cpp
#include "modules/graph/dag_validator.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace agentkernel {

namespace {

enum class VisitState : uint8_t {
    UNVISITED,
    IN_PROGRESS,
    DONE
};

} // namespace

std::vector<size_t> find_cycle(const std::vector<std::vector<size_t>>& dependencies) {
    const size_t n = dependencies.size();
    std::vector<VisitState> state(n, VisitState::UNVISITED);
    // (node, next dependency position); explicit stack so deep chains do not overflow
    std::vector<std::pair<size_t, size_t>> stack;

    for (size_t root = 0; root < n; ++root) {
        if (state[root] != VisitState::UNVISITED) continue;

        state[root] = VisitState::IN_PROGRESS;
        stack.emplace_back(root, 0);

        while (!stack.empty()) {
            auto& [current, pos] = stack.back();
            if (pos < dependencies[current].size()) {
                size_t next = dependencies[current][pos++];
                if (state[next] == VisitState::IN_PROGRESS) {
                    // back edge: everything on the stack from `next` upwards is the cycle
                    std::vector<size_t> cycle;
                    auto it = std::find_if(stack.begin(), stack.end(),
                                           [next](const auto& frame) { return frame.first == next; });
                    for (; it != stack.end(); ++it) {
                        cycle.push_back(it->first);
                    }
                    return cycle;
                }
                if (state[next] == VisitState::UNVISITED) {
                    state[next] = VisitState::IN_PROGRESS;
                    stack.emplace_back(next, 0);
                }
            } else {
                state[current] = VisitState::DONE;
                stack.pop_back();
            }
        }
    }
    return {};
}

std::vector<size_t> topological_order(const std::vector<std::vector<size_t>>& dependencies) {
    const size_t n = dependencies.size();
    std::vector<size_t> in_degree(n, 0);
    std::vector<std::vector<size_t>> dependents(n);

    for (size_t i = 0; i < n; ++i) {
        in_degree[i] = dependencies[i].size();
        for (size_t dep : dependencies[i]) {
            dependents[dep].push_back(i);
        }
    }

    // min-heap on declaration index keeps the order reproducible
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < n; ++i) {
        if (in_degree[i] == 0) ready.push(i);
    }

    std::vector<size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(current);
        for (size_t child : dependents[current]) {
            if (--in_degree[child] == 0) {
                ready.push(child);
            }
        }
    }
    return order;
}

ExecutionPlanPtr validate(const WorkflowConfig& config) {
    const auto& agents = config.agents;

    // 1. 建立 id -> 声明下标
    std::unordered_map<NodeId, size_t> index;
    index.reserve(agents.size());
    for (size_t i = 0; i < agents.size(); ++i) {
        if (agents[i].id.empty()) {
            throw ConfigError("Node at position " + std::to_string(i) + " has an empty id");
        }
        if (!index.emplace(agents[i].id, i).second) {
            throw ConfigError("Duplicate node id '" + agents[i].id + "'");
        }
    }

    // 2. 解析依赖 (duplicates collapse to one edge)
    std::vector<std::vector<size_t>> dependencies(agents.size());
    for (size_t i = 0; i < agents.size(); ++i) {
        std::unordered_set<size_t> seen;
        for (const auto& dep_id : agents[i].depends_on) {
            auto it = index.find(dep_id);
            if (it == index.end()) {
                throw GraphError::unknown_dependency(agents[i].id, dep_id);
            }
            if (seen.insert(it->second).second) {
                dependencies[i].push_back(it->second);
            }
        }
    }

    // 3. 环检测
    auto cycle = find_cycle(dependencies);
    if (!cycle.empty()) {
        std::vector<NodeId> names;
        names.reserve(cycle.size());
        for (size_t idx : cycle) {
            names.push_back(agents[idx].id);
        }
        throw GraphError::cycle_detected(std::move(names));
    }

    // 4. 拓扑排序
    auto order = topological_order(dependencies);
    if (order.size() != agents.size()) {
        // find_cycle and Kahn disagree only if the adjacency is corrupt
        throw GraphError::cycle_detected({});
    }

    logger()->debug("Workflow '{}' validated: {} nodes", config.id, agents.size());
    return std::make_shared<const ExecutionPlan>(config, std::move(dependencies), std::move(order));
}

} // namespace agentkernel
