#ifndef AGENTKERNEL_CORE_TYPES_BUDGET_H
#define AGENTKERNEL_CORE_TYPES_BUDGET_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace agentkernel {

// Per-run execution budget
struct ExecutionBudget {
    uint64_t max_tokens = 0;  // 0 表示无限制
    uint64_t timeout_ms = 0;  // 0 表示无超时

    // Atomic counters so readers (snapshots) never need the run lock
    mutable std::atomic<uint64_t> tokens_used{0};
    mutable std::atomic<uint64_t> invocations_used{0};
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}
    ExecutionBudget(uint64_t tokens, uint64_t timeout)
        : max_tokens(tokens), timeout_ms(timeout), start_time(std::chrono::steady_clock::now()) {}

    // 移动时重置计数器
    ExecutionBudget(ExecutionBudget&& other) noexcept
        : max_tokens(other.max_tokens),
          timeout_ms(other.timeout_ms),
          tokens_used(0),
          invocations_used(0),
          start_time(std::chrono::steady_clock::now()) {}

    ExecutionBudget& operator=(ExecutionBudget&& other) noexcept {
        if (this != &other) {
            max_tokens = other.max_tokens;
            timeout_ms = other.timeout_ms;
            tokens_used = 0;
            invocations_used = 0;
            start_time = std::chrono::steady_clock::now();
        }
        return *this;
    }

    ExecutionBudget(const ExecutionBudget&) = delete;
    ExecutionBudget& operator=(const ExecutionBudget&) = delete;

    bool tokens_exceeded() const {
        return max_tokens > 0 && tokens_used.load() > max_tokens;
    }

    std::optional<std::chrono::steady_clock::time_point> deadline() const {
        if (timeout_ms == 0) return std::nullopt;
        // a deadline past the clock's range is no deadline at all
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::time_point::max() - start_time);
        if (timeout_ms >= static_cast<uint64_t>(headroom.count())) return std::nullopt;
        return start_time + std::chrono::milliseconds(timeout_ms);
    }

    bool expired(std::chrono::steady_clock::time_point now) const {
        auto d = deadline();
        return d.has_value() && now >= *d;
    }

    // Tokens are reported after the fact, so the charge always lands.
    // Returns false once the total is over the limit.
    bool consume_tokens(uint64_t tokens) {
        uint64_t total = tokens_used.fetch_add(tokens) + tokens;
        return max_tokens == 0 || total <= max_tokens;
    }

    void count_invocation() { invocations_used.fetch_add(1); }
};

} // namespace agentkernel

#endif // AGENTKERNEL_CORE_TYPES_BUDGET_H
