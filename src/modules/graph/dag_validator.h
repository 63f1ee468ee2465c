// modules/graph/dag_validator.h
#ifndef AGENTKERNEL_MODULES_GRAPH_DAG_VALIDATOR_H
#define AGENTKERNEL_MODULES_GRAPH_DAG_VALIDATOR_H

#include "core/types/node.h"
#include "core/types/plan.h"
#include <vector>

namespace agentkernel {

// Validates a workflow as a DAG and builds its ExecutionPlan.
//
// Throws ConfigError for duplicate or empty node ids, GraphError for an
// unresolved dependency or a cycle. No side effects; safe to call
// concurrently for different workflows.
ExecutionPlanPtr validate(const WorkflowConfig& config);

// Finds one cycle over `dependencies` (declaration-indexed adjacency, edges
// point node -> its dependency). Returns the nodes on the cycle, empty if none.
std::vector<size_t> find_cycle(const std::vector<std::vector<size_t>>& dependencies);

// Kahn's algorithm; ties broken by the smallest declaration index.
// Returns fewer than N indices if the graph has a cycle.
std::vector<size_t> topological_order(const std::vector<std::vector<size_t>>& dependencies);

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_GRAPH_DAG_VALIDATOR_H
