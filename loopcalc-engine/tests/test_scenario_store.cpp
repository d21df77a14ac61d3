#include <catch2/catch_test_macros.hpp>
#include "../src/scenario_store.hpp"
#include "stk_fixture.hpp"
#include <limits>

using namespace loopcalc;

TEST_CASE("ScenarioStore resolves defaults then overrides", "[scenario_store]") {
    ModelRegistry registry = testing::build_stk_registry();
    ScenarioStore scenarios = testing::build_stk_scenarios(registry);

    SECTION("Base uses every default") {
        ResolvedInputs inputs = scenarios.resolve_inputs("Base", registry);

        REQUIRE(inputs.size() == 3);
        REQUIRE(inputs.at("Production.materialCost") == 120.0);
        REQUIRE(inputs.at("Production.energyCost") == 60.0);
        REQUIRE(inputs.at("Logistics.transportCost") == 35.0);
    }

    SECTION("Overrides win over defaults") {
        ResolvedInputs inputs = scenarios.resolve_inputs("HighEnergyPrices", registry);

        REQUIRE(inputs.at("Production.energyCost") == 90.0);
        REQUIRE(inputs.at("Logistics.transportCost") == 40.0);
    }

    SECTION("Resolution contains inputs only") {
        ResolvedInputs inputs = scenarios.resolve_inputs("HighEnergyPrices", registry);
        REQUIRE(inputs.find("Production.co2Cost") == inputs.end());
    }
}

TEST_CASE("Overriding one input leaves its siblings at their defaults", "[scenario_store]") {
    ModelRegistry registry = testing::build_stk_registry();

    ScenarioStore scenarios;
    scenarios.define_scenario("CheapEnergy", {{"Production.energyCost", 30.0}});
    scenarios.seal(registry);

    ResolvedInputs inputs = scenarios.resolve_inputs("CheapEnergy", registry);

    REQUIRE(inputs.at("Production.energyCost") == 30.0);
    REQUIRE(inputs.at("Production.materialCost") == 120.0);
    REQUIRE(inputs.at("Logistics.transportCost") == 35.0);
}

TEST_CASE("ScenarioStore resolve_defaults covers every input", "[scenario_store]") {
    ModelRegistry registry = testing::build_stk_registry();
    ResolvedInputs inputs = ScenarioStore::resolve_defaults(registry);

    REQUIRE(inputs.size() == registry.input_identities().size());
    REQUIRE(inputs.at("Production.energyCost") == 60.0);
}

TEST_CASE("ScenarioStore rejects invalid overrides", "[scenario_store][errors]") {
    ModelRegistry registry = testing::build_stk_registry();
    ScenarioStore scenarios;

    SECTION("Unknown identity") {
        scenarios.define_scenario("Typo", {{"Production.enrgyCost", 1.0}});
        REQUIRE_THROWS_AS(scenarios.validate(registry), InvalidOverrideError);
        REQUIRE_THROWS_AS(scenarios.resolve_inputs("Typo", registry), InvalidOverrideError);
    }

    SECTION("Short name instead of qualified identity") {
        scenarios.define_scenario("Short", {{"energyCost", 1.0}});
        REQUIRE_THROWS_AS(scenarios.seal(registry), InvalidOverrideError);
        REQUIRE_FALSE(scenarios.is_sealed());
    }

    SECTION("Calculated attribute") {
        scenarios.define_scenario("Forced", {{"Production.co2Cost", 5.0}});
        REQUIRE_THROWS_AS(scenarios.seal(registry), InvalidOverrideError);
    }

    SECTION("Non-finite value") {
        scenarios.define_scenario("Broken", {{"Production.energyCost", std::numeric_limits<double>::quiet_NaN()}});
        REQUIRE_THROWS_AS(scenarios.seal(registry), InvalidOverrideError);
    }
}

TEST_CASE("ScenarioStore rejects invalid scenario definitions", "[scenario_store][errors]") {
    ModelRegistry registry = testing::build_stk_registry();
    ScenarioStore scenarios;
    scenarios.define_scenario("Base", {});

    SECTION("Duplicate name") {
        REQUIRE_THROWS_AS(scenarios.define_scenario("Base", {}), DefinitionError);
    }

    SECTION("Empty name") {
        REQUIRE_THROWS_AS(scenarios.define_scenario("", {}), DefinitionError);
    }

    SECTION("Unknown scenario") {
        REQUIRE_THROWS_AS(scenarios.resolve_inputs("Missing", registry), UnknownScenarioError);
        REQUIRE_THROWS_AS(scenarios.get("Missing"), UnknownScenarioError);
    }

    SECTION("Sealed store") {
        scenarios.seal(registry);
        REQUIRE(scenarios.is_sealed());
        REQUIRE_THROWS_AS(scenarios.define_scenario("Late", {}), RegistrySealedError);
    }
}

TEST_CASE("ScenarioStore lists scenarios by name", "[scenario_store]") {
    ModelRegistry registry = testing::build_stk_registry();
    ScenarioStore scenarios = testing::build_stk_scenarios(registry);

    REQUIRE(scenarios.size() == 2);
    REQUIRE(scenarios.contains("HighEnergyPrices"));
    REQUIRE_FALSE(scenarios.contains("LowEnergyPrices"));
    REQUIRE(scenarios.names() == std::vector<std::string>{"Base", "HighEnergyPrices"});
    REQUIRE(scenarios.get("HighEnergyPrices").overrides.size() == 2);
}
