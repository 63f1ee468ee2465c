#ifndef AGENTKERNEL_CORE_TYPES_STATUS_H
#define AGENTKERNEL_CORE_TYPES_STATUS_H

#include <cstdint>

namespace agentkernel {

enum class RunStatus : uint8_t {
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED
};

// Pending -> Running -> {Completed, Failed}
enum class NodeStatus : uint8_t {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

// Why a node ended up FAILED
enum class FailureKind : uint8_t {
    NONE,
    INVOCATION_ERROR,
    MISSING_SIGNATURE,
    TIMEOUT,
    BUDGET_EXCEEDED,
    CANCELLED
};

const char* to_string(RunStatus status);
const char* to_string(NodeStatus status);
const char* to_string(FailureKind kind);

inline bool is_terminal(RunStatus status) {
    return status == RunStatus::COMPLETED || status == RunStatus::FAILED;
}

inline bool is_terminal(NodeStatus status) {
    return status == NodeStatus::COMPLETED || status == NodeStatus::FAILED;
}

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_TYPES_STATUS_H
