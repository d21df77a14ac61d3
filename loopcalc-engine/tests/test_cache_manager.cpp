#include <catch2/catch_test_macros.hpp>
#include "../src/cache_manager.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace loopcalc;

namespace {

RunResult make_result(const std::string& version, RunState status, double value = 1.0) {
    RunResult result;
    result.scenario = "Base";
    result.model_version = version;
    result.status = status;
    if (status == RunState::DONE || status == RunState::EXHAUSTED) {
        result.values["A.x"] = value;
    }
    return result;
}

GroupCacheEntry make_group(const std::string& version, const std::string& label,
                           std::vector<std::string> upstream, std::vector<double> values) {
    GroupCacheEntry entry;
    entry.model_version = version;
    entry.group_label = label;
    entry.upstream_inputs = std::move(upstream);
    entry.values = std::move(values);
    entry.diagnostics.converged = true;
    return entry;
}

} // anonymous namespace

// ============================================================================
// Scenario tier
// ============================================================================

TEST_CASE("CacheManager stores and returns scenario results", "[cache_manager]") {
    CacheManager cache;

    REQUIRE_FALSE(cache.get("fp1").has_value());
    REQUIRE(cache.put("fp1", make_result("v1", RunState::DONE, 42.0)));

    auto hit = cache.get("fp1");
    REQUIRE(hit.has_value());
    REQUIRE(hit->from_cache);
    REQUIRE(hit->value("A.x") == 42.0);

    auto stats = cache.get_stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.entries_count == 1);
}

TEST_CASE("CacheManager only stores finished runs", "[cache_manager]") {
    CacheManager cache;

    REQUIRE(cache.put("done", make_result("v1", RunState::DONE)));
    REQUIRE(cache.put("exhausted", make_result("v1", RunState::EXHAUSTED)));
    REQUIRE_FALSE(cache.put("failed", make_result("v1", RunState::FAILED)));
    REQUIRE_FALSE(cache.put("cancelled", make_result("v1", RunState::CANCELLED)));

    REQUIRE(cache.get_stats().entries_count == 2);
    REQUIRE_FALSE(cache.get("failed").has_value());
}

TEST_CASE("CacheManager evicts the least recently used entry", "[cache_manager]") {
    CacheManager cache(2);

    cache.put("a", make_result("v1", RunState::DONE, 1.0));
    cache.put("b", make_result("v1", RunState::DONE, 2.0));

    // Touch "a" so "b" becomes the oldest
    REQUIRE(cache.get("a").has_value());
    cache.put("c", make_result("v1", RunState::DONE, 3.0));

    REQUIRE(cache.get("a").has_value());
    REQUIRE_FALSE(cache.get("b").has_value());
    REQUIRE(cache.get("c").has_value());
    REQUIRE(cache.get_stats().evictions == 1);
}

TEST_CASE("get_or_compute runs the computation once", "[cache_manager]") {
    CacheManager cache;
    int calls = 0;
    auto compute = [&calls]() {
        calls++;
        return make_result("v1", RunState::DONE, 7.0);
    };

    RunResult first = cache.get_or_compute("fp", compute);
    RunResult second = cache.get_or_compute("fp", compute);

    REQUIRE(calls == 1);
    REQUIRE_FALSE(first.from_cache);
    REQUIRE(second.from_cache);
    REQUIRE(second.value("A.x") == 7.0);
}

TEST_CASE("Concurrent callers share one in-flight computation", "[cache_manager][concurrency]") {
    CacheManager cache;
    std::atomic<int> calls{0};
    std::atomic<int> done{0};

    auto compute = [&calls]() {
        calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return make_result("v1", RunState::DONE, 5.0);
    };

    std::vector<std::thread> threads;
    std::vector<double> seen(8, 0.0);
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            RunResult result = cache.get_or_compute("shared", compute);
            seen[i] = result.value("A.x");
            done.fetch_add(1);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(calls.load() == 1);
    REQUIRE(done.load() == 8);
    for (double value : seen) {
        REQUIRE(value == 5.0);
    }
    REQUIRE_FALSE(cache.is_in_flight("shared"));

    auto stats = cache.get_stats();
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hits + stats.single_flight_waits == 7);
}

namespace {

// Leader on its own thread: holds the flight until one waiter has joined, then finishes with `status`
struct LeaderAndWaiter {
    RunResult leader_result;
    RunResult waiter_result;
    int waiter_calls = 0;
};

LeaderAndWaiter lead_and_wait(CacheManager& cache, RunState leader_status) {
    LeaderAndWaiter outcome;

    std::thread leader([&]() {
        outcome.leader_result = cache.get_or_compute("fp", [&cache, leader_status]() {
            for (int i = 0; i < 500 && cache.get_stats().single_flight_waits == 0; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return make_result("v1", leader_status);
        });
    });

    while (!cache.is_in_flight("fp")) {
        std::this_thread::yield();
    }

    std::thread waiter([&]() {
        outcome.waiter_result = cache.get_or_compute("fp", [&outcome]() {
            outcome.waiter_calls++;
            return make_result("v1", RunState::DONE, 7.0);
        });
    });

    leader.join();
    waiter.join();
    return outcome;
}

} // anonymous namespace

TEST_CASE("A waiter does not inherit the leader's cancellation", "[cache_manager][concurrency]") {
    CacheManager cache;

    LeaderAndWaiter outcome = lead_and_wait(cache, RunState::CANCELLED);

    REQUIRE(outcome.leader_result.status == RunState::CANCELLED);
    REQUIRE(outcome.waiter_result.status == RunState::DONE);
    REQUIRE(outcome.waiter_result.value("A.x") == 7.0);
    REQUIRE_FALSE(outcome.waiter_result.from_cache);
    REQUIRE(outcome.waiter_calls == 1);

    auto stats = cache.get_stats();
    REQUIRE(stats.single_flight_waits == 1);
    REQUIRE(stats.misses == 2);
    REQUIRE(stats.entries_count == 1);
    REQUIRE_FALSE(cache.is_in_flight("fp"));
}

TEST_CASE("A waiter shares the leader's failure", "[cache_manager][concurrency]") {
    CacheManager cache;

    LeaderAndWaiter outcome = lead_and_wait(cache, RunState::FAILED);

    REQUIRE(outcome.leader_result.status == RunState::FAILED);
    REQUIRE(outcome.waiter_result.status == RunState::FAILED);
    REQUIRE(outcome.waiter_calls == 0);
    REQUIRE(cache.get_stats().entries_count == 0);
}

TEST_CASE("get_or_compute does not store failed runs", "[cache_manager]") {
    CacheManager cache;
    int calls = 0;
    auto compute = [&calls]() {
        calls++;
        return make_result("v1", RunState::FAILED);
    };

    cache.get_or_compute("fp", compute);
    RunResult again = cache.get_or_compute("fp", compute);

    REQUIRE(calls == 2);
    REQUIRE_FALSE(again.from_cache);
    REQUIRE(again.status == RunState::FAILED);
}

TEST_CASE("get_or_compute propagates exceptions", "[cache_manager][errors]") {
    CacheManager cache;
    auto compute = []() -> RunResult {
        throw std::runtime_error("boom");
    };

    REQUIRE_THROWS_AS(cache.get_or_compute("fp", compute), std::runtime_error);
    REQUIRE_FALSE(cache.is_in_flight("fp"));
    REQUIRE_FALSE(cache.get("fp").has_value());

    // The key is usable again afterwards
    RunResult result = cache.get_or_compute("fp", []() { return make_result("v1", RunState::DONE); });
    REQUIRE(result.success());
}

// ============================================================================
// Group tier and invalidation
// ============================================================================

TEST_CASE("CacheManager stores group entries", "[cache_manager]") {
    CacheManager cache;
    cache.put_group("g1", make_group("v1", "A.a|A.b", {"A.in"}, {1.0, 2.0}));

    auto entry = cache.get_group("g1");
    REQUIRE(entry.has_value());
    REQUIRE(entry->values == std::vector<double>{1.0, 2.0});
    REQUIRE_FALSE(cache.get_group("g2").has_value());

    auto stats = cache.get_stats();
    REQUIRE(stats.group_hits == 1);
    REQUIRE(stats.group_misses == 1);
    REQUIRE(stats.group_entries_count == 1);

    auto last = cache.last_group_values("v1", "A.a|A.b");
    REQUIRE(last.has_value());
    REQUIRE((*last)[1] == 2.0);
    REQUIRE_FALSE(cache.last_group_values("v2", "A.a|A.b").has_value());
}

TEST_CASE("Group tier evicts the least recently used entry", "[cache_manager]") {
    CacheManager cache(16, 2);
    cache.put_group("g1", make_group("v1", "A", {"A.in"}, {1.0}));
    cache.put_group("g2", make_group("v1", "B", {"B.in"}, {2.0}));
    REQUIRE(cache.get_group("g1").has_value());
    cache.put_group("g3", make_group("v1", "C", {"C.in"}, {3.0}));

    REQUIRE(cache.get_group("g1").has_value());
    REQUIRE_FALSE(cache.get_group("g2").has_value());
    REQUIRE(cache.get_group("g3").has_value());
}

TEST_CASE("invalidate_input removes only dependent entries", "[cache_manager]") {
    CacheManager cache;

    cache.put_group("production", make_group("v1", "P", {"P.material", "P.energy"}, {1.0}));
    cache.put_group("logistics", make_group("v1", "L", {"L.transport"}, {2.0}));
    cache.put_group("other-version", make_group("v2", "P", {"P.energy"}, {3.0}));
    cache.put("v1-base", make_result("v1", RunState::DONE));
    cache.put("v2-base", make_result("v2", RunState::DONE));

    size_t removed = cache.invalidate_input("v1", "P.energy");

    REQUIRE(removed == 2);
    REQUIRE_FALSE(cache.get_group("production").has_value());
    REQUIRE_FALSE(cache.last_group_values("v1", "P").has_value());
    REQUIRE(cache.get_group("logistics").has_value());
    REQUIRE(cache.get_group("other-version").has_value());
    REQUIRE_FALSE(cache.get("v1-base").has_value());
    REQUIRE(cache.get("v2-base").has_value());
}

TEST_CASE("invalidate_version removes every entry of a version", "[cache_manager]") {
    CacheManager cache;

    cache.put_group("g1", make_group("v1", "P", {"P.energy"}, {1.0}));
    cache.put_group("g2", make_group("v2", "P", {"P.energy"}, {2.0}));
    cache.put("s1", make_result("v1", RunState::DONE));
    cache.put("s2", make_result("v2", RunState::DONE));

    REQUIRE(cache.invalidate_version("v1") == 2);
    REQUIRE_FALSE(cache.get_group("g1").has_value());
    REQUIRE_FALSE(cache.last_group_values("v1", "P").has_value());
    REQUIRE(cache.last_group_values("v2", "P").has_value());
    REQUIRE(cache.get("s2").has_value());
}

TEST_CASE("clear empties both tiers", "[cache_manager]") {
    CacheManager cache;
    cache.put_group("g1", make_group("v1", "P", {"P.energy"}, {1.0}));
    cache.put("s1", make_result("v1", RunState::DONE));

    cache.clear();

    auto stats = cache.get_stats();
    REQUIRE(stats.entries_count == 0);
    REQUIRE(stats.group_entries_count == 0);
    REQUIRE_FALSE(cache.last_group_values("v1", "P").has_value());
}
