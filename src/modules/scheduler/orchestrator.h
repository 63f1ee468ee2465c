// modules/scheduler/orchestrator.h
#ifndef AGENTKERNEL_MODULES_SCHEDULER_ORCHESTRATOR_H
#define AGENTKERNEL_MODULES_SCHEDULER_ORCHESTRATOR_H

#include "core/types/plan.h"
#include "core/types/status.h"
#include "modules/executor/agent_invoker.h"
#include "modules/runtime/runtime_state_machine.h"
#include <tbb/concurrent_hash_map.h>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace agentkernel {

class SignatureStore;

enum class DispatchMode : uint8_t {
    AUTOMATIC, // eligible nodes are invoked as soon as they become eligible
    MANUAL     // nodes run only through invoke_node()
};

const char* to_string(DispatchMode mode);
DispatchMode parse_dispatch_mode(std::string_view name); // throws ConfigError

struct OrchestratorConfig {
    size_t max_concurrency = 4; // simultaneous invocations across all runs
};

// Result of a manual invoke: the node afterwards and the input it was given
struct ManualInvocation {
    NodeSnapshot node;
    nlohmann::json input = nullptr; // null if the node failed before invocation
};

// Drives runs: claims eligible nodes, invokes them on a TBB arena, writes
// signatures, advances the state machine and re-dispatches. One watchdog
// thread enforces run timeouts.
class Orchestrator {
public:
    Orchestrator(RuntimeStateMachine& runtime, SignatureStore& signatures, AgentInvoker& invoker,
                 OrchestratorConfig config = {});
    // Stops the watchdog, cancels in-flight invocations and waits for them
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // create_run + start + first dispatch
    RunId start(ExecutionPlanPtr plan, DispatchMode mode = DispatchMode::AUTOMATIC);

    // begin_node + synchronous execution on the calling thread.
    // Throws RunNotFoundError, NodeNotFoundError, InvalidTransitionError.
    ManualInvocation invoke_node(const RunId& run_id, const NodeId& node_id);

    // Blocks until the run is terminal and none of its invocations is still
    // executing. Returns the status seen last (possibly non-terminal on timeout).
    RunStatus wait(const RunId& run_id,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Force-fails outstanding nodes with CANCELLED. False if already terminal.
    bool stop(const RunId& run_id);

    // Drops state, signatures and driver. Throws InvalidTransitionError while Running.
    void discard(const RunId& run_id);

    DispatchMode mode(const RunId& run_id) const;
    size_t in_flight() const { return total_in_flight_.load(); }

private:
    struct RunDriver {
        RunId run_id;
        ExecutionPlanPtr plan;
        DispatchMode mode = DispatchMode::AUTOMATIC;
        CancellationSource cancel;
        std::atomic<size_t> in_flight{0};
        std::mutex mutex;
        std::condition_variable cv;
    };
    using DriverPtr = std::shared_ptr<RunDriver>;
    using DriverTable = tbb::concurrent_hash_map<RunId, DriverPtr>;
    using Deadline = std::pair<std::chrono::steady_clock::time_point, RunId>;

    DriverPtr find_driver(const RunId& run_id) const; // throws RunNotFoundError

    void dispatch(const DriverPtr& driver);
    void enqueue_node(const DriverPtr& driver, NodeId node_id);
    nlohmann::json execute_node(RunDriver& driver, const NodeId& node_id);
    void fail_quietly(RunDriver& driver, const NodeId& node_id, const std::string& error, FailureKind kind,
                      uint64_t tokens_used = 0);
    void finish_invocation(RunDriver& driver);
    void notify(RunDriver& driver);

    void arm_deadline(const RunId& run_id);
    void watchdog_loop();
    void on_deadline(const RunId& run_id);

    RuntimeStateMachine& runtime_;
    SignatureStore& signatures_;
    AgentInvoker& invoker_;
    OrchestratorConfig config_;

    DriverTable drivers_;

    // invocation block on I/O, let the arena exceed the default worker count
    tbb::global_control parallelism_;
    tbb::task_arena arena_;

    std::atomic<size_t> total_in_flight_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    std::mutex watchdog_mutex_;
    std::condition_variable watchdog_cv_;
    std::priority_queue<Deadline, std::vector<Deadline>, std::greater<Deadline>> deadlines_;
    bool shutting_down_ = false;
    std::thread watchdog_; // last: started after everything above exists
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_SCHEDULER_ORCHESTRATOR_H
