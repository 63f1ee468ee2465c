// modules/executor/invocation_builder.h
#ifndef AGENTKERNEL_MODULES_EXECUTOR_INVOCATION_BUILDER_H
#define AGENTKERNEL_MODULES_EXECUTOR_INVOCATION_BUILDER_H

#include "modules/executor/agent_invoker.h"
#include "core/types/plan.h"
#include <map>

namespace agentkernel {

// Assembles the request for one node: renders the prompt template, then appends
// a context section per dependency output.
//
// Template data: node {id, role, model}, run_id, dependencies (id -> output),
// signatures (id -> signature), user_directive ("" unless the node accepts one).
// Throws TemplateError.
InvocationRequest build_invocation(const RunId& run_id,
                                   const ExecutionPlan& plan,
                                   const NodeId& node_id,
                                   std::map<NodeId, Signature> prior_signatures,
                                   const std::map<NodeId, nlohmann::json>& dependency_outputs,
                                   CancellationToken cancel = {});

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_EXECUTOR_INVOCATION_BUILDER_H
