// modules/scheduler/orchestrator.cpp
#include "modules/scheduler/orchestrator.h"
#include "modules/executor/invocation_builder.h"
#include "modules/signature/signature_store.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>

namespace agentkernel {

namespace {

size_t arena_width(const OrchestratorConfig& config) {
    return std::max<size_t>(1, config.max_concurrency);
}

// Keep the default pool, plus room for every invocation slot
size_t parallelism_for(const OrchestratorConfig& config) {
    size_t hardware = static_cast<size_t>(tbb::this_task_arena::max_concurrency());
    return std::max(hardware, arena_width(config) + 1);
}

} // namespace

const char* to_string(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::AUTOMATIC: return "automatic";
        case DispatchMode::MANUAL: return "manual";
    }
    return "unknown";
}

DispatchMode parse_dispatch_mode(std::string_view name) {
    if (name == "automatic" || name == "auto") return DispatchMode::AUTOMATIC;
    if (name == "manual") return DispatchMode::MANUAL;
    throw ConfigError("Unknown dispatch mode '" + std::string(name) + "'");
}

Orchestrator::Orchestrator(RuntimeStateMachine& runtime, SignatureStore& signatures, AgentInvoker& invoker,
                           OrchestratorConfig config)
    : runtime_(runtime),
      signatures_(signatures),
      invoker_(invoker),
      config_(config),
      parallelism_(tbb::global_control::max_allowed_parallelism, parallelism_for(config)),
      arena_(static_cast<int>(arena_width(config)), 0),
      watchdog_([this] { watchdog_loop(); }) {
    logger()->debug("Orchestrator ready: max_concurrency={}", arena_width(config_));
}

Orchestrator::~Orchestrator() {
    {
        std::lock_guard lock(watchdog_mutex_);
        shutting_down_ = true;
    }
    watchdog_cv_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    // tasks hold their driver but never touch the table
    for (auto& entry : drivers_) {
        entry.second->cancel.cancel();
    }

    std::unique_lock lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return total_in_flight_.load() == 0; });
}

Orchestrator::DriverPtr Orchestrator::find_driver(const RunId& run_id) const {
    DriverTable::const_accessor acc;
    if (!drivers_.find(acc, run_id)) {
        throw RunNotFoundError(run_id);
    }
    return acc->second;
}

RunId Orchestrator::start(ExecutionPlanPtr plan, DispatchMode mode) {
    auto created = runtime_.create_run(plan);

    auto driver = std::make_shared<RunDriver>();
    driver->run_id = created.run_id;
    driver->plan = std::move(plan);
    driver->mode = mode;
    {
        DriverTable::accessor acc;
        drivers_.insert(acc, driver->run_id);
        acc->second = driver;
    }

    runtime_.start(driver->run_id);
    arm_deadline(driver->run_id);
    dispatch(driver);
    notify(*driver); // empty workflows are already terminal

    return driver->run_id;
}

void Orchestrator::dispatch(const DriverPtr& driver) {
    if (driver->mode != DispatchMode::AUTOMATIC) {
        return;
    }
    for (auto& node_id : runtime_.begin_eligible_nodes(driver->run_id)) {
        enqueue_node(driver, std::move(node_id));
    }
}

void Orchestrator::enqueue_node(const DriverPtr& driver, NodeId node_id) {
    driver->in_flight.fetch_add(1);
    total_in_flight_.fetch_add(1);

    arena_.enqueue([this, driver, node_id = std::move(node_id)] {
        try {
            execute_node(*driver, node_id);
            dispatch(driver);
        } catch (const RunNotFoundError&) {
            // discarded meanwhile
        } catch (const std::exception& e) {
            logger()->error("Run {}: worker for '{}' aborted: {}", driver->run_id, node_id, e.what());
            fail_quietly(*driver, node_id, e.what(), FailureKind::INVOCATION_ERROR);
        }
        finish_invocation(*driver);
    });
}

void Orchestrator::finish_invocation(RunDriver& driver) {
    driver.in_flight.fetch_sub(1);
    notify(driver);

    // last touch of `this`: the destructor may proceed once this lock is released
    std::lock_guard lock(idle_mutex_);
    total_in_flight_.fetch_sub(1);
    idle_cv_.notify_all();
}

void Orchestrator::notify(RunDriver& driver) {
    {
        std::lock_guard lock(driver.mutex);
    }
    driver.cv.notify_all();
}

void Orchestrator::fail_quietly(RunDriver& driver, const NodeId& node_id, const std::string& error,
                                FailureKind kind, uint64_t tokens_used) {
    try {
        if (!runtime_.fail_node(driver.run_id, node_id, error, kind, tokens_used)) {
            driver.cancel.cancel(); // budget exhausted
        }
    } catch (const InvalidTransitionError& e) {
        // node was force-failed by timeout/stop/budget in the meantime
        logger()->debug("Run {}: dropping failure of '{}': {}", driver.run_id, node_id, e.what());
    } catch (const RunNotFoundError&) {
        logger()->debug("Run {} discarded while '{}' was failing", driver.run_id, node_id);
    }
}

nlohmann::json Orchestrator::execute_node(RunDriver& driver, const NodeId& node_id) {
    const RunId& run_id = driver.run_id;
    const ExecutionPlan& plan = *driver.plan;
    nlohmann::json input = nullptr;

    std::map<NodeId, Signature> prior;
    try {
        prior = signatures_.get_inputs(run_id, plan.dependencies(node_id));
    } catch (const MissingSignatureError& e) {
        logger()->error("Run {}: scheduling violation before '{}': {}", run_id, node_id, e.what());
        fail_quietly(driver, node_id, e.what(), FailureKind::MISSING_SIGNATURE);
        return input;
    }

    InvocationRequest request;
    try {
        request = build_invocation(run_id, plan, node_id, std::move(prior),
                                   runtime_.dependency_outputs(run_id, node_id), driver.cancel.token());
    } catch (const TemplateError& e) {
        fail_quietly(driver, node_id, e.what(), FailureKind::INVOCATION_ERROR);
        return input;
    } catch (const RunNotFoundError&) {
        return input;
    }
    input = request;

    InvocationResult result;
    try {
        result = invoker_.invoke(request);
    } catch (const std::exception& e) {
        result = InvocationResult::failure(std::string("invoker threw: ") + e.what());
    }

    // true also when the run has been discarded
    auto run_ended = [&] {
        try {
            return is_terminal(runtime_.status(run_id));
        } catch (const RunNotFoundError&) {
            return true;
        }
    };

    try {
        if (run_ended()) {
            logger()->debug("Run {} already ended, dropping result of '{}'", run_id, node_id);
            return input;
        }

        if (!result.success) {
            fail_quietly(driver, node_id, result.error, FailureKind::INVOCATION_ERROR, result.tokens_used);
            return input;
        }

        // signature first: dependents may begin as soon as complete_node returns
        signatures_.put(run_id, node_id, result.signature.value_or(Signature{}));
        if (!runtime_.complete_node(run_id, node_id, result.tokens_used, std::move(result.output))) {
            driver.cancel.cancel(); // budget exhausted
        }
    } catch (const InvalidTransitionError& e) {
        if (run_ended()) {
            logger()->debug("Run {}: '{}' finished after the run ended: {}", run_id, node_id, e.what());
        } else {
            logger()->error("Run {}: unexpected transition failure for '{}': {}", run_id, node_id, e.what());
        }
    } catch (const RunNotFoundError&) {
        logger()->debug("Run {} discarded while '{}' was executing", run_id, node_id);
    }
    return input;
}

ManualInvocation Orchestrator::invoke_node(const RunId& run_id, const NodeId& node_id) {
    auto driver = find_driver(run_id);
    runtime_.begin_node(run_id, node_id);

    driver->in_flight.fetch_add(1);
    total_in_flight_.fetch_add(1);

    // released on every exit path, including exceptions
    struct InFlight {
        Orchestrator& self;
        RunDriver& driver;
        ~InFlight() { self.finish_invocation(driver); }
    };

    ManualInvocation invocation;
    {
        InFlight in_flight{*this, *driver};
        try {
            invocation.input = execute_node(*driver, node_id);
            dispatch(driver); // no-op for manual runs
        } catch (const RunNotFoundError&) {
            throw;
        } catch (const std::exception& e) {
            logger()->error("Run {}: manual invocation of '{}' aborted: {}", run_id, node_id, e.what());
            fail_quietly(*driver, node_id, e.what(), FailureKind::INVOCATION_ERROR);
        }
    }

    auto snap = runtime_.snapshot(run_id);
    if (const NodeSnapshot* node = snap.find_node(node_id)) {
        invocation.node = *node;
    }
    return invocation;
}

RunStatus Orchestrator::wait(const RunId& run_id, std::optional<std::chrono::milliseconds> timeout) {
    auto driver = find_driver(run_id);
    RunStatus last = RunStatus::IDLE;
    auto done = [&] {
        last = runtime_.status(run_id);
        return is_terminal(last) && driver->in_flight.load() == 0;
    };

    std::unique_lock lock(driver->mutex);
    if (timeout) {
        driver->cv.wait_for(lock, *timeout, done);
    } else {
        driver->cv.wait(lock, done);
    }
    return last;
}

bool Orchestrator::stop(const RunId& run_id) {
    auto driver = find_driver(run_id);
    bool stopped = runtime_.terminate_run(run_id, FailureKind::CANCELLED, "Manual Stop");
    driver->cancel.cancel();
    notify(*driver);
    return stopped;
}

void Orchestrator::discard(const RunId& run_id) {
    auto driver = find_driver(run_id);
    if (runtime_.status(run_id) == RunStatus::RUNNING) {
        throw InvalidTransitionError(run_id, "cannot discard a running run");
    }

    // results of cancelled invocations must not land after the purge
    {
        std::unique_lock lock(driver->mutex);
        driver->cv.wait(lock, [&] { return driver->in_flight.load() == 0; });
    }

    runtime_.discard(run_id);
    size_t purged = signatures_.purge(run_id);
    drivers_.erase(run_id);
    logger()->info("Run {} discarded ({} signatures purged)", run_id, purged);
}

DispatchMode Orchestrator::mode(const RunId& run_id) const {
    return find_driver(run_id)->mode;
}

void Orchestrator::arm_deadline(const RunId& run_id) {
    auto deadline = runtime_.deadline(run_id);
    if (!deadline) {
        return;
    }
    {
        std::lock_guard lock(watchdog_mutex_);
        deadlines_.emplace(*deadline, run_id);
    }
    watchdog_cv_.notify_all();
}

void Orchestrator::watchdog_loop() {
    std::unique_lock lock(watchdog_mutex_);
    while (!shutting_down_) {
        if (deadlines_.empty()) {
            watchdog_cv_.wait(lock);
            continue;
        }
        Deadline next = deadlines_.top();
        if (std::chrono::steady_clock::now() < next.first) {
            watchdog_cv_.wait_until(lock, next.first);
            continue;
        }
        deadlines_.pop();

        lock.unlock();
        on_deadline(next.second);
        lock.lock();
    }
}

void Orchestrator::on_deadline(const RunId& run_id) {
    try {
        auto driver = find_driver(run_id);
        if (runtime_.expire_if_overdue(run_id)) {
            driver->cancel.cancel();
        }
        notify(*driver);
    } catch (const RunNotFoundError&) {
        // discarded before its deadline
    }
}

} // namespace agentkernel
