// core/kernel.cpp
#include "core/kernel.h"
#include "modules/graph/dag_validator.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace agentkernel {

Kernel::Kernel(std::unique_ptr<AgentInvoker> invoker, const KernelConfig& config)
    : config_(config),
      invoker_(std::move(invoker)),
      runtime_(&trace_) {
    if (!invoker_) {
        throw std::invalid_argument("Kernel needs an invoker");
    }
    init_logging(config_.log_level, config_.log_pattern);
    if (config_.max_concurrency == 0) {
        config_.max_concurrency = std::max(1u, std::thread::hardware_concurrency());
    }
    orchestrator_ = std::make_unique<Orchestrator>(runtime_, signatures_, *invoker_,
                                                   OrchestratorConfig{.max_concurrency = config_.max_concurrency});
    logger()->info("Kernel ready (max_concurrency={})", config_.max_concurrency);
}

Kernel::~Kernel() {
    orchestrator_.reset();
}

RunId Kernel::start(const WorkflowConfig& workflow, DispatchMode mode) {
    auto plan = validate(workflow);
    return orchestrator_->start(std::move(plan), mode);
}

RunId Kernel::start_from_string(const std::string& content, DispatchMode mode) {
    return start(parser_.parse_from_string(content), mode);
}

RunId Kernel::start_from_file(const std::string& file_path, DispatchMode mode) {
    return start(parser_.parse_from_file(file_path), mode);
}

RunId Kernel::start_from_json(const nlohmann::json& workflow, DispatchMode mode) {
    return start(parser_.parse_from_json(workflow), mode);
}

void Kernel::discard(const RunId& run_id) {
    orchestrator_->discard(run_id);
    trace_.clear(run_id);
}

RunStatus Kernel::wait(const RunId& run_id, std::optional<std::chrono::milliseconds> timeout) {
    return orchestrator_->wait(run_id, timeout);
}

} // namespace agentkernel
