// modules/control/control_surface.h
#ifndef AGENTKERNEL_MODULES_CONTROL_CONTROL_SURFACE_H
#define AGENTKERNEL_MODULES_CONTROL_CONTROL_SURFACE_H

#include "core/kernel.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace agentkernel {

// Transport-neutral response: an HTTP-style status and a JSON body
struct Response {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// Request/response handlers for the runtime control API. An HTTP or WebSocket
// layer maps its routes onto these; handle() does that mapping for a plain
// method + target string. Errors come back as {"error": {kind, message, ...}}.
class ControlSurface {
public:
    explicit ControlSurface(Kernel& kernel) : kernel_(kernel) {}

    // GET /health
    Response health() const;
    // POST /runtime/start
    Response start_workflow(const std::string& body);
    Response start_workflow(const nlohmann::json& body);
    // GET /runtime/state?run_id=
    Response get_state(const std::optional<RunId>& run_id) const;
    // GET /runtime/signatures?run_id=
    Response get_signatures(const std::optional<RunId>& run_id) const;
    // GET /runtime/events?run_id=
    Response get_events(const std::optional<RunId>& run_id) const;
    // GET /runtime/topology?run_id=
    Response get_topology(const std::optional<RunId>& run_id) const;
    // POST /runtime/agent/{id}/invoke?run_id=
    Response invoke_agent(const std::optional<RunId>& run_id, const NodeId& node_id);
    // POST /runtime/{run_id}/stop
    Response stop_run(const RunId& run_id);
    // DELETE /runtime/{run_id}
    Response discard_run(const RunId& run_id);

    // Routes "GET /runtime/state?run_id=..." style requests; 404 for unknown
    // routes, 405 for a known path with the wrong method
    Response handle(const std::string& method, const std::string& target, const std::string& body = "");

private:
    Kernel& kernel_;
};

// "a=1&b=2" -> {a:1, b:2}, percent-decoded
std::map<std::string, std::string> parse_query(const std::string& query);

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_CONTROL_CONTROL_SURFACE_H
