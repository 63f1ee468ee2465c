// modules/control/control_surface.cpp
#include "modules/control/control_surface.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include <cctype>
#include <sstream>
#include <vector>

namespace agentkernel {

namespace {

Response error_response(int status, const std::string& kind, const std::string& message,
                        nlohmann::json extra = nlohmann::json::object()) {
    nlohmann::json error = {{"kind", kind}, {"message", message}};
    error.update(extra);
    return Response{.status = status, .body = {{"error", std::move(error)}}};
}

Response missing_run_id() {
    return error_response(400, "MissingParameter", "Query parameter 'run_id' is required");
}

Response from_graph_error(const GraphError& e) {
    nlohmann::json extra = {{"node", e.node()}};
    if (e.kind() == GraphErrorKind::UNKNOWN_DEPENDENCY && e.dependency()) {
        extra["edge"] = {{"from", *e.dependency()}, {"to", e.node()}};
    }
    if (e.kind() == GraphErrorKind::CYCLE_DETECTED) {
        extra["cycle"] = e.cycle();
    }
    return error_response(400, to_string(e.kind()), e.what(), std::move(extra));
}

Response from_invalid_transition(const InvalidTransitionError& e) {
    nlohmann::json extra = {{"run_id", e.run_id()}};
    if (e.node_id()) {
        extra["node"] = *e.node_id();
    }
    if (e.current()) {
        extra["current"] = to_string(*e.current());
    }
    return error_response(409, "InvalidTransition", e.what(), std::move(extra));
}

// Runs `fn`, translating the kernel's exceptions into error responses
template <typename Fn>
Response guarded(const char* operation, Fn&& fn) {
    try {
        return fn();
    } catch (const GraphError& e) {
        return from_graph_error(e);
    } catch (const ConfigError& e) {
        return error_response(400, "ConfigError", e.what());
    } catch (const RunNotFoundError& e) {
        return error_response(404, "RunNotFound", e.what(), {{"run_id", e.run_id()}});
    } catch (const NodeNotFoundError& e) {
        return error_response(404, "NodeNotFound", e.what(), {{"run_id", e.run_id()}, {"node", e.node_id()}});
    } catch (const InvalidTransitionError& e) {
        return from_invalid_transition(e);
    } catch (const std::exception& e) {
        logger()->error("{} failed: {}", operation, e.what());
        return error_response(500, "InternalError", e.what());
    }
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(percent_decode(segment));
        }
    }
    return segments;
}

} // namespace

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[percent_decode(pair)] = "";
        } else {
            params[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
        }
    }
    return params;
}

Response ControlSurface::health() const {
    return Response{.status = 200, .body = {{"status", "ok"}}};
}

Response ControlSurface::start_workflow(const std::string& body) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return error_response(400, "BadRequest", std::string("Request body is not valid JSON: ") + e.what());
    }
    return start_workflow(parsed);
}

Response ControlSurface::start_workflow(const nlohmann::json& body) {
    return guarded("start", [&]() -> Response {
        if (!body.is_object()) {
            return error_response(400, "BadRequest", "Request body must be a JSON object");
        }
        DispatchMode mode = DispatchMode::AUTOMATIC;
        if (auto it = body.find("dispatch"); it != body.end() && !it->is_null()) {
            if (!it->is_string()) {
                throw ConfigError("Field 'dispatch' must be a string");
            }
            mode = parse_dispatch_mode(it->get<std::string>());
        }
        // either the workflow itself or {"workflow": {...}, "dispatch": ...}
        const nlohmann::json& workflow = body.contains("workflow") ? body.at("workflow") : body;
        RunId run_id = kernel_.start_from_json(workflow, mode);
        return Response{.status = 201, .body = {{"run_id", run_id}, {"dispatch", to_string(mode)}}};
    });
}

Response ControlSurface::get_state(const std::optional<RunId>& run_id) const {
    if (!run_id) {
        return missing_run_id();
    }
    return guarded("state", [&]() -> Response {
        return Response{.status = 200, .body = kernel_.snapshot(*run_id)};
    });
}

Response ControlSurface::get_signatures(const std::optional<RunId>& run_id) const {
    if (!run_id) {
        return missing_run_id();
    }
    return guarded("signatures", [&]() -> Response {
        if (!kernel_.runtime().contains(*run_id)) {
            throw RunNotFoundError(*run_id);
        }
        nlohmann::json signatures = kernel_.signatures().get_all(*run_id);
        return Response{.status = 200, .body = {{"run_id", *run_id}, {"signatures", std::move(signatures)}}};
    });
}

Response ControlSurface::get_events(const std::optional<RunId>& run_id) const {
    if (!run_id) {
        return missing_run_id();
    }
    return guarded("events", [&]() -> Response {
        if (!kernel_.runtime().contains(*run_id)) {
            throw RunNotFoundError(*run_id);
        }
        nlohmann::json events = kernel_.trace().get_events(*run_id);
        return Response{.status = 200, .body = {{"run_id", *run_id}, {"events", std::move(events)}}};
    });
}

Response ControlSurface::get_topology(const std::optional<RunId>& run_id) const {
    if (!run_id) {
        return missing_run_id();
    }
    return guarded("topology", [&]() -> Response {
        auto plan = kernel_.runtime().plan(*run_id);
        nlohmann::json edges = nlohmann::json::array();
        for (size_t index : plan->topo_indices()) {
            const NodeId& to = plan->node_at(index).id;
            for (size_t dep : plan->dependency_indices(index)) {
                edges.push_back({{"from", plan->node_at(dep).id}, {"to", to}});
            }
        }
        return Response{.status = 200, .body = {{"run_id", *run_id},
                                                {"workflow_id", plan->workflow_id()},
                                                {"order", plan->order()},
                                                {"edges", std::move(edges)}}};
    });
}

Response ControlSurface::invoke_agent(const std::optional<RunId>& run_id, const NodeId& node_id) {
    if (!run_id) {
        return missing_run_id();
    }
    return guarded("invoke", [&]() -> Response {
        ManualInvocation result = kernel_.orchestrator().invoke_node(*run_id, node_id);
        return Response{.status = 200, .body = {{"node", result.node}, {"input", std::move(result.input)}}};
    });
}

Response ControlSurface::stop_run(const RunId& run_id) {
    return guarded("stop", [&]() -> Response {
        bool stopped = kernel_.orchestrator().stop(run_id);
        nlohmann::json body = kernel_.snapshot(run_id);
        body["stopped"] = stopped;
        return Response{.status = 200, .body = std::move(body)};
    });
}

Response ControlSurface::discard_run(const RunId& run_id) {
    return guarded("discard", [&]() -> Response {
        kernel_.discard(run_id);
        return Response{.status = 204, .body = nullptr};
    });
}

Response ControlSurface::handle(const std::string& method, const std::string& target, const std::string& body) {
    std::string path = target;
    std::map<std::string, std::string> query;
    if (auto q = target.find('?'); q != std::string::npos) {
        path = target.substr(0, q);
        query = parse_query(target.substr(q + 1));
    }
    std::optional<RunId> run_id;
    if (auto it = query.find("run_id"); it != query.end() && !it->second.empty()) {
        run_id = it->second;
    }

    auto segments = split_path(path);
    auto method_not_allowed = [&]() {
        return error_response(405, "MethodNotAllowed", method + " not allowed on " + path);
    };
    logger()->debug("control: {} {}", method, target);

    if (segments.size() == 1 && segments[0] == "health") {
        return method == "GET" ? health() : method_not_allowed();
    }
    if (segments.empty() || segments[0] != "runtime") {
        return error_response(404, "NotFound", "No route for " + path);
    }

    if (segments.size() == 2) {
        const std::string& leaf = segments[1];
        if (leaf == "start") {
            return method == "POST" ? start_workflow(body) : method_not_allowed();
        }
        if (leaf == "state" || leaf == "signatures" || leaf == "events" || leaf == "topology") {
            if (method != "GET") {
                return method_not_allowed();
            }
            if (leaf == "state") return get_state(run_id);
            if (leaf == "signatures") return get_signatures(run_id);
            if (leaf == "events") return get_events(run_id);
            return get_topology(run_id);
        }
        // DELETE /runtime/{run_id}
        return method == "DELETE" ? discard_run(leaf) : method_not_allowed();
    }
    if (segments.size() == 3 && segments[2] == "stop") {
        return method == "POST" ? stop_run(segments[1]) : method_not_allowed();
    }
    if (segments.size() == 4 && segments[1] == "agent" && segments[3] == "invoke") {
        return method == "POST" ? invoke_agent(run_id, segments[2]) : method_not_allowed();
    }
    return error_response(404, "NotFound", "No route for " + path);
}

} // namespace agentkernel
