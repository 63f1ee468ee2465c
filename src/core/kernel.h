// core/kernel.h
#ifndef AGENTKERNEL_CORE_KERNEL_H
#define AGENTKERNEL_CORE_KERNEL_H

#include "core/kernel_config.h"
#include "modules/executor/agent_invoker.h"
#include "modules/parser/workflow_parser.h"
#include "modules/runtime/runtime_state_machine.h"
#include "modules/scheduler/orchestrator.h"
#include "modules/signature/signature_store.h"
#include "modules/trace/trace_exporter.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace agentkernel {

// Owns every component of one kernel instance
class Kernel {
public:
    Kernel(std::unique_ptr<AgentInvoker> invoker, const KernelConfig& config = {});
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Validates and starts; throws ConfigError / GraphError
    RunId start(const WorkflowConfig& workflow, DispatchMode mode = DispatchMode::AUTOMATIC);
    RunId start_from_string(const std::string& content, DispatchMode mode = DispatchMode::AUTOMATIC);
    RunId start_from_file(const std::string& file_path, DispatchMode mode = DispatchMode::AUTOMATIC);
    RunId start_from_json(const nlohmann::json& workflow, DispatchMode mode = DispatchMode::AUTOMATIC);

    RunStatus wait(const RunId& run_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    RunSnapshot snapshot(const RunId& run_id) const { return runtime_.snapshot(run_id); }

    // Forgets state, signatures and events of a finished run
    void discard(const RunId& run_id);

    RuntimeStateMachine& runtime() { return runtime_; }
    SignatureStore& signatures() { return signatures_; }
    TraceExporter& trace() { return trace_; }
    Orchestrator& orchestrator() { return *orchestrator_; }
    AgentInvoker& invoker() { return *invoker_; }
    const KernelConfig& config() const { return config_; }

private:
    KernelConfig config_;
    std::unique_ptr<AgentInvoker> invoker_;
    WorkflowParser parser_;
    TraceExporter trace_;
    SignatureStore signatures_;
    RuntimeStateMachine runtime_;
    std::unique_ptr<Orchestrator> orchestrator_; // destroyed first: joins in-flight work
};

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_KERNEL_H
