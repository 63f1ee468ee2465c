// modules/executor/agent_invoker.h
#ifndef AGENTKERNEL_MODULES_EXECUTOR_AGENT_INVOKER_H
#define AGENTKERNEL_MODULES_EXECUTOR_AGENT_INVOKER_H

#include "core/types/node.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentkernel {

// Read side of a cancellation flag. Default-constructed tokens never cancel.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    bool cancelled() const { return flag_ && flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Everything an execution backend gets for one node invocation
struct InvocationRequest {
    RunId run_id;
    AgentNode node;
    std::string prompt;                               // rendered
    nlohmann::json input_data = nlohmann::json::object(); // dependency id -> output
    std::map<NodeId, Signature> prior_signatures;      // dependency id -> signature
    std::vector<std::string> file_paths;
    CancellationToken cancel;
};

void to_json(nlohmann::json& j, const InvocationRequest& request);

struct InvocationResult {
    bool success = false;
    nlohmann::json output = nullptr;
    std::optional<Signature> signature;
    uint64_t tokens_used = 0;
    std::string error;

    static InvocationResult ok(nlohmann::json output, std::optional<Signature> signature, uint64_t tokens);
    static InvocationResult failure(std::string error, uint64_t tokens = 0);
};

// Execution collaborator. invoke() may block and is called concurrently from
// several worker threads. Failures are returned, not thrown; an exception that
// escapes is treated as a failed invocation.
class AgentInvoker {
public:
    virtual ~AgentInvoker() = default;
    virtual InvocationResult invoke(const InvocationRequest& request) = 0;
};

// Dry-run backend: echoes the rendered prompt, derives a signature from the
// run and node ids, reports one token per prompt word
class EchoInvoker : public AgentInvoker {
public:
    InvocationResult invoke(const InvocationRequest& request) override;
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_EXECUTOR_AGENT_INVOKER_H
