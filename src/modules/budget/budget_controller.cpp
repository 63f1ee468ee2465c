// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"

namespace agentkernel {

BudgetController::BudgetController(uint64_t max_tokens, uint64_t timeout_ms)
    : budget_(max_tokens, timeout_ms) {}

void BudgetController::start() {
    budget_.start_time = std::chrono::steady_clock::now();
    started_ = true;
}

bool BudgetController::try_consume_tokens(uint64_t tokens) {
    return budget_.consume_tokens(tokens);
}

bool BudgetController::expired(std::chrono::steady_clock::time_point now) const {
    // 未启动的运行不会超时
    return started_ && budget_.expired(now);
}

std::optional<std::chrono::steady_clock::time_point> BudgetController::deadline() const {
    if (!started_) {
        return std::nullopt;
    }
    return budget_.deadline();
}

} // namespace agentkernel
