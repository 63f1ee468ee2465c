// tests/test_dag_validator.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/graph/dag_validator.h"
#include "core/types/errors.h"
#include "support/scripted_invoker.h"
#include <algorithm>
#include <string>
#include <vector>

using namespace agentkernel;
using agentkernel::testing::make_node;
using agentkernel::testing::make_workflow;

namespace {

size_t position_of(const std::vector<NodeId>& order, const NodeId& id) {
    auto it = std::find(order.begin(), order.end(), id);
    REQUIRE(it != order.end());
    return static_cast<size_t>(it - order.begin());
}

} // namespace

// Test 1: every node comes after all of its dependencies
TEST_CASE("Topological order respects dependencies", "[graph][validator]") {
    auto workflow = make_workflow({
        make_node("report", {"search", "critique"}),
        make_node("search", {"plan"}),
        make_node("plan"),
        make_node("critique", {"plan"}),
        make_node("notify", {"report", "plan"}),
    });

    auto plan = validate(workflow);
    const auto& order = plan->order();
    REQUIRE(order.size() == 5);

    for (const auto& node : workflow.agents) {
        for (const auto& dep : node.depends_on) {
            REQUIRE(position_of(order, dep) < position_of(order, node.id));
        }
    }
}

// Test 2: ties go to the earlier declared node, so repeated validation agrees
TEST_CASE("Topological order is deterministic", "[graph][validator]") {
    auto workflow = make_workflow({
        make_node("c"),
        make_node("a"),
        make_node("b", {"c"}),
        make_node("d", {"a"}),
    });

    auto first = validate(workflow);
    REQUIRE(first->order() == std::vector<NodeId>{"c", "a", "b", "d"});
    for (int i = 0; i < 10; ++i) {
        REQUIRE(validate(workflow)->order() == first->order());
    }
}

TEST_CASE("Unknown dependency names the offending edge", "[graph][validator]") {
    auto workflow = make_workflow({
        make_node("a"),
        make_node("b", {"a", "ghost"}),
    });

    try {
        validate(workflow);
        FAIL("validate accepted an unknown dependency");
    } catch (const GraphError& e) {
        REQUIRE(e.kind() == GraphErrorKind::UNKNOWN_DEPENDENCY);
        REQUIRE(e.node() == "b");
        REQUIRE(e.dependency() == std::optional<NodeId>("ghost"));
    }
}

TEST_CASE("Cycle is reported with a node on the cycle", "[graph][validator]") {
    SECTION("three node cycle behind an acyclic prefix") {
        auto workflow = make_workflow({
            make_node("root"),
            make_node("x", {"root", "z"}),
            make_node("y", {"x"}),
            make_node("z", {"y"}),
        });

        try {
            validate(workflow);
            FAIL("validate accepted a cycle");
        } catch (const GraphError& e) {
            REQUIRE(e.kind() == GraphErrorKind::CYCLE_DETECTED);
            std::vector<NodeId> on_cycle{"x", "y", "z"};
            REQUIRE(std::find(on_cycle.begin(), on_cycle.end(), e.node()) != on_cycle.end());
            REQUIRE(e.cycle().size() == 3);
            for (const auto& id : e.cycle()) {
                REQUIRE(id != "root");
            }
        }
    }

    SECTION("self dependency") {
        auto workflow = make_workflow({make_node("loop", {"loop"})});
        try {
            validate(workflow);
            FAIL("validate accepted a self dependency");
        } catch (const GraphError& e) {
            REQUIRE(e.kind() == GraphErrorKind::CYCLE_DETECTED);
            REQUIRE(e.node() == "loop");
        }
    }
}

TEST_CASE("Duplicate ids are a configuration error", "[graph][validator]") {
    auto workflow = make_workflow({make_node("a"), make_node("a")});
    REQUIRE_THROWS_AS(validate(workflow), ConfigError);
}

TEST_CASE("Repeated dependency collapses to one edge", "[graph][validator]") {
    auto workflow = make_workflow({make_node("a"), make_node("b", {"a", "a"})});
    auto plan = validate(workflow);
    REQUIRE(plan->dependencies("b") == std::vector<NodeId>{"a"});
    REQUIRE(plan->dependents("a") == std::vector<NodeId>{"b"});
}

TEST_CASE("Empty workflow validates to an empty plan", "[graph][validator]") {
    auto plan = validate(make_workflow({}));
    REQUIRE(plan->size() == 0);
    REQUIRE(plan->order().empty());
}

// Long chains must not exhaust the stack
TEST_CASE("Deep chain validates", "[graph][validator]") {
    std::vector<AgentNode> agents;
    agents.push_back(make_node("n0"));
    for (int i = 1; i < 5000; ++i) {
        agents.push_back(make_node("n" + std::to_string(i), {"n" + std::to_string(i - 1)}));
    }
    auto plan = validate(make_workflow(std::move(agents)));
    REQUIRE(plan->order().front() == "n0");
    REQUIRE(plan->order().back() == "n4999");
}

TEST_CASE("find_cycle and topological_order on raw adjacency", "[graph]") {
    // 0 <- 1 <- 2, 3 independent
    std::vector<std::vector<size_t>> acyclic{{}, {0}, {1}, {}};
    REQUIRE(find_cycle(acyclic).empty());
    REQUIRE(topological_order(acyclic) == std::vector<size_t>{0, 1, 2, 3});

    std::vector<std::vector<size_t>> cyclic{{1}, {0}, {}};
    REQUIRE(find_cycle(cyclic).size() == 2);
    REQUIRE(topological_order(cyclic).size() == 1);
}
