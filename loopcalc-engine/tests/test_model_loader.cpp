#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/io/model_loader.hpp"
#include "../src/simulation_engine.hpp"
#include "stk_fixture.hpp"
#include <cstdlib>

using namespace loopcalc;
using namespace loopcalc::io;
using Catch::Matchers::WithinAbs;

#ifndef LOOPCALC_EXAMPLES_DIR
#define LOOPCALC_EXAMPLES_DIR "../loopcalc-engine/examples"
#endif

namespace {

const std::string STK_MODEL_PATH = std::string(LOOPCALC_EXAMPLES_DIR) + "/stk_model.json";

// Single block "A" holding the given attribute JSON
std::string single_block(const std::string& attributes) {
    return R"({ "version": "t", "blocks": { "A": { )" + attributes + R"( } } })";
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("Load the STK model file", "[model_loader]") {
    testing::silence_logging();
    LoadedModel model = load_model_from_file(STK_MODEL_PATH);

    REQUIRE(model.registry.version() == "1");
    REQUIRE(model.registry.size() == 7);
    REQUIRE_FALSE(model.description.empty());
    REQUIRE(model.scenarios.names() == std::vector<std::string>{"Base", "HighEnergyPrices"});
    REQUIRE(model.registry.input_identities() == std::vector<std::string>{
        "Production.materialCost", "Production.energyCost", "Logistics.transportCost"
    });

    SimulationEngine engine(model.registry, model.scenarios);

    RunResult base = engine.run("Base");
    REQUIRE(base.status == RunState::DONE);
    REQUIRE_THAT(base.value("Production.disposalCost"), WithinAbs(testing::BASE_DISPOSAL, 1e-6));
    REQUIRE_THAT(base.value("Logistics.ecoFees"), WithinAbs(testing::BASE_ECO_FEES, 1e-6));

    RunResult high = engine.run("HighEnergyPrices");
    REQUIRE(high.status == RunState::DONE);
    REQUIRE_THAT(high.value("Production.co2Cost"), WithinAbs(testing::HIGH_CO2, 1e-6));
    REQUIRE_THAT(high.value("Logistics.logisticsCost"), WithinAbs(testing::HIGH_LOGISTICS, 1e-6));
}

TEST_CASE("Load a model from a string", "[model_loader]") {
    std::string json_str = R"({
        "version": 2,
        "blocks": {
            "A": {
                "x": { "type": "input", "value": 3 },
                "y": { "type": "input", "value": "4.5" }
            }
        },
        "scenarios": {
            "Flat": { "A.x": 10 }
        }
    })";

    LoadedModel model = load_model_from_string(json_str);

    REQUIRE(model.registry.version() == "2");
    REQUIRE(model.registry.resolve("A.y").default_value == 4.5);
    REQUIRE(model.scenarios.resolve_inputs("Flat", model.registry).at("A.x") == 10.0);
    REQUIRE(model.scenarios.is_sealed());
}

TEST_CASE("Model files expand environment variables in numbers", "[model_loader]") {
    setenv("LOOPCALC_TEST_ENERGY", "75", 1);

    LoadedModel model = load_model_from_string(single_block(
        R"("energy": { "type": "input", "value": "${LOOPCALC_TEST_ENERGY}" })"));

    REQUIRE(model.registry.resolve("A.energy").default_value == 75.0);

    unsetenv("LOOPCALC_TEST_ENERGY");
}

TEST_CASE("Environment variable expansion", "[model_loader]") {
    setenv("LOOPCALC_TEST_VAR", "42", 1);

    REQUIRE(expand_environment_variables("${LOOPCALC_TEST_VAR}") == "42");
    REQUIRE(expand_environment_variables("$LOOPCALC_TEST_VAR.5") == "42.5");
    REQUIRE(expand_environment_variables("cost=${LOOPCALC_TEST_VAR}!") == "cost=42!");
    REQUIRE(expand_environment_variables("${LOOPCALC_TEST_UNSET_VAR}") == "");
    REQUIRE(expand_environment_variables("${LOOPCALC_TEST_VAR") == "${LOOPCALC_TEST_VAR");
    REQUIRE(expand_environment_variables("5$") == "5$");
    REQUIRE(expand_environment_variables("plain") == "plain");

    unsetenv("LOOPCALC_TEST_VAR");
}

TEST_CASE("Built-in formula kinds", "[model_loader]") {
    testing::silence_logging();
    std::string json_str = single_block(R"(
        "x": { "type": "input", "value": 2 },
        "y": { "type": "input", "value": 5 },
        "sum": { "type": "calculated", "dependencies": ["x", "y"],
                 "formula": { "kind": "linear", "constant": 1, "terms": { "x": 2, "y": -1 } } },
        "prod": { "type": "calculated", "dependencies": ["x", "y"],
                  "formula": { "kind": "product", "coefficient": 0.5 } },
        "low": { "type": "calculated", "dependencies": ["x", "y"], "formula": { "kind": "min" } },
        "high": { "type": "calculated", "dependencies": ["x", "y"], "formula": { "kind": "max" } },
        "fixed": { "type": "calculated", "dependencies": [], "formula": { "kind": "linear", "constant": 7 } }
    )");

    LoadedModel model = load_model_from_string(json_str);
    SimulationEngine engine(model.registry, model.scenarios);
    RunResult result = engine.run_defaults("Defaults");

    REQUIRE(result.status == RunState::DONE);
    REQUIRE(result.value("A.sum") == 0.0);
    REQUIRE(result.value("A.prod") == 5.0);
    REQUIRE(result.value("A.low") == 2.0);
    REQUIRE(result.value("A.high") == 5.0);
    REQUIRE(result.value("A.fixed") == 7.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Malformed model files", "[model_loader][errors]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(load_model_from_string("{ not json"), ModelParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(load_model_from_string("[1, 2]"), ModelParseError);
    }

    SECTION("Missing blocks") {
        REQUIRE_THROWS_AS(load_model_from_string(R"({ "version": "1" })"), ModelParseError);
    }

    SECTION("Missing attribute type") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"("x": { "value": 1 })")), ModelParseError);
    }

    SECTION("Mistyped attribute type") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"("x": { "type": 5, "value": 1 })")),
                          ModelParseError);
    }

    SECTION("Unknown attribute type") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"("x": { "type": "lookup", "value": 1 })")),
                          ModelParseError);
    }

    SECTION("Input without value") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"("x": { "type": "input" })")), ModelParseError);
    }

    SECTION("Value that is not a number") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"("x": { "type": "input", "value": "12abc" })")),
                          ModelParseError);
    }

    SECTION("Unknown formula kind") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "x": { "type": "input", "value": 1 },
            "y": { "type": "calculated", "dependencies": ["x"], "formula": { "kind": "spline" } })")),
            ModelParseError);
    }

    SECTION("Linear term that is not a dependency") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "x": { "type": "input", "value": 1 },
            "z": { "type": "input", "value": 1 },
            "y": { "type": "calculated", "dependencies": ["x"],
                   "formula": { "kind": "linear", "terms": { "z": 1 } } })")),
            ModelParseError);
    }

    SECTION("Aggregate without dependencies") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "y": { "type": "calculated", "dependencies": [], "formula": { "kind": "max" } })")),
            ModelParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_model_from_file("does_not_exist.json"), ModelParseError);
    }
}

TEST_CASE("Model files are checked like code-defined models", "[model_loader][errors]") {
    SECTION("Input with formula") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "x": { "type": "input", "value": 1, "formula": { "kind": "min" } })")),
            UnexpectedFormulaError);
    }

    SECTION("Calculated attribute with value") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "x": { "type": "input", "value": 1 },
            "y": { "type": "calculated", "value": 2, "dependencies": ["x"], "formula": { "kind": "min" } })")),
            UnexpectedFormulaError);
    }

    SECTION("Calculated attribute without formula") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "x": { "type": "input", "value": 1 },
            "y": { "type": "calculated", "dependencies": ["x"] })")),
            MissingFormulaError);
    }

    SECTION("Unknown dependency") {
        REQUIRE_THROWS_AS(load_model_from_string(single_block(R"(
            "y": { "type": "calculated", "dependencies": ["ghost"], "formula": { "kind": "max" } })")),
            UnknownDependencyError);
    }

    SECTION("Scenario overriding a calculated attribute") {
        std::string json_str = R"({
            "blocks": { "A": {
                "x": { "type": "input", "value": 1 },
                "y": { "type": "calculated", "dependencies": ["x"], "formula": { "kind": "max" } }
            } },
            "scenarios": { "Forced": { "A": { "y": 3 } } }
        })";
        REQUIRE_THROWS_AS(load_model_from_string(json_str), InvalidOverrideError);
    }

    SECTION("Scenario overriding an unknown attribute") {
        std::string json_str = R"({
            "blocks": { "A": { "x": { "type": "input", "value": 1 } } },
            "scenarios": { "Typo": { "A.z": 3 } }
        })";
        REQUIRE_THROWS_AS(load_model_from_string(json_str), InvalidOverrideError);
    }
}
