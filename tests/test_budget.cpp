// tests/test_budget.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/budget/budget_controller.h"
#include <chrono>
#include <thread>
#include <vector>

using namespace agentkernel;
using namespace std::chrono_literals;

TEST_CASE("Zero limits mean unlimited", "[budget]") {
    BudgetController budget(0, 0);
    budget.start();
    REQUIRE(budget.try_consume_tokens(1'000'000));
    REQUIRE_FALSE(budget.exceeded());
    REQUIRE_FALSE(budget.deadline().has_value());
    REQUIRE_FALSE(budget.expired(std::chrono::steady_clock::now() + 24h));
}

TEST_CASE("Token charge lands even when it overruns", "[budget]") {
    BudgetController budget(100, 0);
    budget.start();

    REQUIRE(budget.try_consume_tokens(100));
    REQUIRE_FALSE(budget.exceeded());
    REQUIRE_FALSE(budget.try_consume_tokens(1));
    REQUIRE(budget.exceeded());
    REQUIRE(budget.tokens_used() == 101);
}

TEST_CASE("Deadline counts from start", "[budget]") {
    BudgetController budget(0, 200);
    REQUIRE_FALSE(budget.deadline().has_value());
    REQUIRE_FALSE(budget.expired());

    auto before = std::chrono::steady_clock::now();
    budget.start();
    auto deadline = budget.deadline();
    REQUIRE(deadline.has_value());
    REQUIRE(*deadline >= before + 200ms);
    REQUIRE_FALSE(budget.expired(*deadline - 1ms));
    REQUIRE(budget.expired(*deadline));
}

TEST_CASE("Timeout beyond the clock range has no deadline", "[budget]") {
    BudgetController budget(0, 10'000'000'000'000ULL);
    budget.start();
    REQUIRE_FALSE(budget.deadline().has_value());
    REQUIRE_FALSE(budget.expired());
    REQUIRE_FALSE(budget.expired(std::chrono::steady_clock::now() + 24h));

    BudgetController large(0, 1'000'000'000'000ULL); // about 31 years
    large.start();
    REQUIRE(large.deadline().has_value());
    REQUIRE_FALSE(large.expired());
}

TEST_CASE("Counters are safe under concurrent charges", "[budget][concurrency]") {
    BudgetController budget(0, 0);
    budget.start();

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&budget] {
            for (int i = 0; i < 1000; ++i) {
                budget.try_consume_tokens(2);
                budget.count_invocation();
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(budget.tokens_used() == 16000);
    REQUIRE(budget.invocations() == 8000);
}
