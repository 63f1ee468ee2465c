// tests/test_signature_store.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/signature/signature_store.h"
#include "core/types/errors.h"
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace agentkernel;

TEST_CASE("Put then get returns the stored signature", "[signature]") {
    SignatureStore store;
    store.put("run-1", "A", "sig-A");

    REQUIRE(store.get("run-1", "A") == "sig-A");
    REQUIRE(store.find("run-1", "A") == std::optional<Signature>("sig-A"));
    REQUIRE_FALSE(store.find("run-2", "A").has_value());
    REQUIRE_THROWS_AS(store.get("run-1", "B"), SignatureNotFoundError);
}

TEST_CASE("Latest write wins", "[signature]") {
    SignatureStore store;
    store.put("run-1", "A", "first");
    store.put("run-1", "A", "second");
    REQUIRE(store.get("run-1", "A") == "second");
    REQUIRE(store.size() == 1);
    REQUIRE(store.get_all("run-1").size() == 1);
}

TEST_CASE("get_inputs maps every dependency to its signature", "[signature]") {
    SignatureStore store;
    store.put("run-1", "B", "sig-B");
    store.put("run-1", "C", "sig-C");

    auto inputs = store.get_inputs("run-1", {"B", "C"});
    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs.at("B") == "sig-B");
    REQUIRE(inputs.at("C") == "sig-C");

    REQUIRE(store.get_inputs("run-1", {}).empty());

    try {
        store.get_inputs("run-1", {"B", "D"});
        FAIL("missing dependency was not reported");
    } catch (const MissingSignatureError& e) {
        REQUIRE(e.dependency() == "D");
        REQUIRE(e.run_id() == "run-1");
    }
}

TEST_CASE("Runs are isolated and purge only touches one run", "[signature]") {
    SignatureStore store;
    store.put("run-1", "A", "one");
    store.put("run-2", "A", "two");
    store.put("run-2", "B", "two-b");

    REQUIRE(store.get("run-1", "A") == "one");
    REQUIRE(store.get("run-2", "A") == "two");

    REQUIRE(store.purge("run-2") == 2);
    REQUIRE(store.get_all("run-2").empty());
    REQUIRE(store.get("run-1", "A") == "one");
    REQUIRE(store.purge("run-unknown") == 0);
}

TEST_CASE("Concurrent writers on distinct keys", "[signature][concurrency]") {
    SignatureStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store, t] {
            RunId run = "run-" + std::to_string(t % 2);
            for (int i = 0; i < kPerThread; ++i) {
                NodeId node = "n" + std::to_string(t) + "-" + std::to_string(i);
                store.put(run, node, "sig-" + node);
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(store.size() == kThreads * kPerThread);
    REQUIRE(store.get_all("run-0").size() == (kThreads / 2) * kPerThread);
    REQUIRE(store.get("run-1", "n3-17") == "sig-n3-17");
}

// A reader racing writes to the same key sees one whole value or another
TEST_CASE("Reads racing a write never observe a partial value", "[signature][concurrency]") {
    SignatureStore store;
    const std::string small(16, 'a');
    const std::string large(4096, 'b');
    store.put("run-1", "A", small);

    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            store.put("run-1", "A", i % 2 ? large : small);
        }
        done = true;
    });

    bool torn = false;
    while (!done) {
        auto value = store.get("run-1", "A");
        if (value != small && value != large) {
            torn = true;
        }
    }
    writer.join();
    REQUIRE_FALSE(torn);
}
