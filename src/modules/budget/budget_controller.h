// modules/budget/budget_controller.h
#ifndef AGENTKERNEL_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define AGENTKERNEL_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h" // 引入 ExecutionBudget (已包含 atomic 计数器)
#include <chrono>
#include <cstdint>
#include <optional>

namespace agentkernel {

// BudgetController 封装一次运行的 token 预算与超时
class BudgetController {
public:
    BudgetController() = default;
    BudgetController(uint64_t max_tokens, uint64_t timeout_ms);

    // (Re)arms the clock; called when the run starts
    void start();

    // 记录 token 消耗, 超出预算时返回 false
    bool try_consume_tokens(uint64_t tokens);
    void count_invocation() { budget_.count_invocation(); }

    bool exceeded() const { return budget_.tokens_exceeded(); }
    bool expired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;

    std::optional<std::chrono::steady_clock::time_point> deadline() const;

    uint64_t tokens_used() const { return budget_.tokens_used.load(); }
    uint64_t invocations() const { return budget_.invocations_used.load(); }
    uint64_t max_tokens() const { return budget_.max_tokens; }
    uint64_t timeout_ms() const { return budget_.timeout_ms; }

private:
    ExecutionBudget budget_;
    bool started_ = false;
};

} // namespace agentkernel

#endif // AGENTKERNEL_MODULES_BUDGET_BUDGET_CONTROLLER_H
