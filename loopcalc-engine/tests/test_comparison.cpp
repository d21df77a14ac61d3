#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/comparison.hpp"
#include "../src/simulation_engine.hpp"
#include "stk_fixture.hpp"

using namespace loopcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

RunResult make_result(const std::string& scenario, std::map<std::string, double> values,
                      const std::string& version = "v1") {
    RunResult result;
    result.scenario = scenario;
    result.model_version = version;
    result.status = RunState::DONE;
    result.values = std::move(values);
    return result;
}

} // anonymous namespace

TEST_CASE("Comparing STK scenarios", "[comparison]") {
    testing::silence_logging();
    ModelRegistry registry = testing::build_stk_registry();
    ScenarioStore scenarios = testing::build_stk_scenarios(registry);
    SimulationEngine engine(registry, scenarios);

    ScenarioComparison comparison = compare_results(engine.run("Base"), engine.run("HighEnergyPrices"));

    REQUIRE(comparison.base_scenario == "Base");
    REQUIRE(comparison.other_scenario == "HighEnergyPrices");
    REQUIRE(comparison.changes.size() == 7);

    // Ordered by identity
    REQUIRE(comparison.changes.front().attribute == "Logistics.ecoFees");

    auto changed = comparison.changed(1e-9);
    REQUIRE(changed.size() == 6);
    for (const auto& change : changed) {
        REQUIRE(change.attribute != "Production.materialCost");
    }

    for (const auto& change : comparison.changes) {
        if (change.attribute == "Production.energyCost") {
            REQUIRE(change.delta == 30.0);
            REQUIRE_THAT(*change.relative_change, WithinRel(0.5, 1e-12));
        }
        if (change.attribute == "Production.disposalCost") {
            REQUIRE_THAT(change.delta, WithinAbs(testing::HIGH_DISPOSAL - testing::BASE_DISPOSAL, 1e-6));
        }
    }
}

TEST_CASE("Relative change is undefined for a zero base", "[comparison]") {
    RunResult base = make_result("Base", {{"A.x", 0.0}, {"A.y", -4.0}});
    RunResult other = make_result("Other", {{"A.x", 2.0}, {"A.y", -2.0}});

    ScenarioComparison comparison = compare_results(base, other);

    REQUIRE(comparison.changes.size() == 2);
    REQUIRE(comparison.changes[0].delta == 2.0);
    REQUIRE_FALSE(comparison.changes[0].relative_change.has_value());
    REQUIRE(comparison.changes[1].delta == 2.0);
    REQUIRE_THAT(*comparison.changes[1].relative_change, WithinRel(0.5, 1e-12));
}

TEST_CASE("changed() applies the tolerance", "[comparison]") {
    RunResult base = make_result("Base", {{"A.x", 1.0}, {"A.y", 1.0}});
    RunResult other = make_result("Other", {{"A.x", 1.0005}, {"A.y", 1.0}});

    ScenarioComparison comparison = compare_results(base, other);

    REQUIRE(comparison.changed().size() == 1);
    REQUIRE(comparison.changed(0.001).empty());
}

TEST_CASE("Comparison requires comparable results", "[comparison][errors]") {
    RunResult base = make_result("Base", {{"A.x", 1.0}});

    SECTION("Failed run") {
        RunResult failed;
        failed.scenario = "Broken";
        failed.model_version = "v1";
        failed.status = RunState::FAILED;
        REQUIRE_THROWS_AS(compare_results(base, failed), std::invalid_argument);
        REQUIRE_THROWS_AS(compare_results(failed, base), std::invalid_argument);
    }

    SECTION("Different model versions") {
        RunResult other = make_result("Other", {{"A.x", 1.0}}, "v2");
        REQUIRE_THROWS_AS(compare_results(base, other), std::invalid_argument);
    }

    SECTION("Missing attribute") {
        RunResult other = make_result("Other", {{"A.z", 1.0}});
        REQUIRE_THROWS_AS(compare_results(base, other), std::invalid_argument);
    }
}
