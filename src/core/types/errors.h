#ifndef AGENTKERNEL_CORE_TYPES_ERRORS_H
#define AGENTKERNEL_CORE_TYPES_ERRORS_H

#include "core/types/node.h"   // 引入 NodeId, RunId
#include "core/types/status.h" // 引入 NodeStatus
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentkernel {

enum class GraphErrorKind : uint8_t {
    UNKNOWN_DEPENDENCY,
    CYCLE_DETECTED
};

const char* to_string(GraphErrorKind kind);

// Raised only by validation, before any run exists
class GraphError : public std::runtime_error {
public:
    // UNKNOWN_DEPENDENCY: `node` declares `dependency` which does not exist
    static GraphError unknown_dependency(const NodeId& node, const NodeId& dependency);
    // CYCLE_DETECTED: `cycle` lists the nodes on the cycle, first == the node reported
    static GraphError cycle_detected(std::vector<NodeId> cycle);

    GraphErrorKind kind() const noexcept { return kind_; }
    const NodeId& node() const noexcept { return node_; }
    const std::optional<NodeId>& dependency() const noexcept { return dependency_; }
    const std::vector<NodeId>& cycle() const noexcept { return cycle_; }

private:
    GraphError(GraphErrorKind kind, NodeId node, std::optional<NodeId> dependency,
               std::vector<NodeId> cycle, const std::string& message);

    GraphErrorKind kind_;
    NodeId node_;
    std::optional<NodeId> dependency_;
    std::vector<NodeId> cycle_;
};

// Malformed workflow / kernel configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RunNotFoundError : public std::runtime_error {
public:
    explicit RunNotFoundError(const RunId& run_id)
        : std::runtime_error("Run not found: " + run_id), run_id_(run_id) {}
    const RunId& run_id() const noexcept { return run_id_; }

private:
    RunId run_id_;
};

class NodeNotFoundError : public std::runtime_error {
public:
    NodeNotFoundError(const RunId& run_id, const NodeId& node_id)
        : std::runtime_error("Node '" + node_id + "' not found in run " + run_id),
          run_id_(run_id), node_id_(node_id) {}
    const RunId& run_id() const noexcept { return run_id_; }
    const NodeId& node_id() const noexcept { return node_id_; }

private:
    RunId run_id_;
    NodeId node_id_;
};

// Rejected state-machine transition. State is left unchanged.
class InvalidTransitionError : public std::runtime_error {
public:
    // node-level
    InvalidTransitionError(const RunId& run_id, const NodeId& node_id, NodeStatus current,
                           NodeStatus requested, const std::string& reason);
    // run-level (start, discard)
    InvalidTransitionError(const RunId& run_id, const std::string& reason);

    const RunId& run_id() const noexcept { return run_id_; }
    const std::optional<NodeId>& node_id() const noexcept { return node_id_; }
    std::optional<NodeStatus> current() const noexcept { return current_; }

private:
    RunId run_id_;
    std::optional<NodeId> node_id_;
    std::optional<NodeStatus> current_;
};

// A dependency has not written its signature yet
class MissingSignatureError : public std::runtime_error {
public:
    MissingSignatureError(const RunId& run_id, const NodeId& dependency)
        : std::runtime_error("Missing signature for dependency '" + dependency + "' in run " + run_id),
          run_id_(run_id), dependency_(dependency) {}
    const RunId& run_id() const noexcept { return run_id_; }
    const NodeId& dependency() const noexcept { return dependency_; }

private:
    RunId run_id_;
    NodeId dependency_;
};

// Prompt template failed to render
class TemplateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SignatureNotFoundError : public std::runtime_error {
public:
    SignatureNotFoundError(const RunId& run_id, const NodeId& node_id)
        : std::runtime_error("No signature stored for '" + node_id + "' in run " + run_id) {}
};

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_TYPES_ERRORS_H
