/**
 * @file stk_costs.cpp
 * @brief Example building the STK cost model in code
 *
 * This example shows how to:
 * - Declare blocks, inputs and calculated attributes with closures
 * - Define a scenario and seal the scenario store
 * - Run scenarios through the SimulationEngine and read diagnostics
 * - Compare two scenarios attribute by attribute
 */

#include "../src/comparison.hpp"
#include "../src/logger.hpp"
#include "../src/simulation_engine.hpp"
#include "../src/io/json_writer.hpp"
#include <iomanip>
#include <iostream>

using namespace loopcalc;

namespace {

ModelRegistry build_stk_model() {
    ModelRegistry registry("stk-1");

    registry.define_block("Production");
    registry.define_block("Logistics");

    registry.define_input("Production", "materialCost", 120.0);
    registry.define_input("Production", "energyCost", 60.0);

    // disposalCost and co2Cost feed each other
    registry.define_calculated("Production", "disposalCost",
        [](const DependencySnapshot& s) { return s["materialCost"] * 0.8 + s["co2Cost"]; },
        {"materialCost", "co2Cost"});
    registry.define_calculated("Production", "co2Cost",
        [](const DependencySnapshot& s) { return s["energyCost"] * 0.1 + s["disposalCost"] * 0.05; },
        {"energyCost", "disposalCost"});

    registry.define_input("Logistics", "transportCost", 35.0);

    // Second loop, downstream of co2Cost
    registry.define_calculated("Logistics", "logisticsCost",
        [](const DependencySnapshot& s) { return s["transportCost"] + s["ecoFees"]; },
        {"transportCost", "ecoFees"});
    registry.define_calculated("Logistics", "ecoFees",
        [](const DependencySnapshot& s) { return s["logisticsCost"] * 0.1 + s["Production.co2Cost"] * 0.05; },
        {"logisticsCost", "Production.co2Cost"});

    registry.seal();
    return registry;
}

void print_result(const RunResult& result) {
    std::cout << result.scenario << " (" << state_to_string(result.status) << ")\n";
    for (const auto& group : result.diagnostics.per_group) {
        std::cout << "  " << group.members.front() << " loop: "
                  << (group.converged ? "converged" : "not converged")
                  << " in " << group.iterations << " iterations\n";
    }
    for (const auto& [identity, value] : result.values) {
        std::cout << "  " << std::left << std::setw(26) << identity << value << "\n";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::WARN;
    log_config.enable_json = false;
    Logger::get_instance().configure(log_config);

    try {
        ModelRegistry registry = build_stk_model();

        ScenarioStore scenarios;
        scenarios.define_scenario("Base", {});
        scenarios.define_scenario("HighEnergyPrices", {
            {"Production.energyCost", 90.0},
            {"Logistics.transportCost", 40.0}
        });
        scenarios.seal(registry);

        SimulationEngine engine(registry, scenarios);
        std::cout << "Cyclic groups: " << engine.analysis().cyclic_count()
                  << ", levels: " << engine.analysis().levels.size() << "\n\n";

        std::cout << std::fixed << std::setprecision(6);

        RunResult base = engine.run("Base");
        RunResult high = engine.run("HighEnergyPrices");
        print_result(base);
        print_result(high);

        ScenarioComparison comparison = compare_results(base, high);
        std::cout << "Changes from Base to HighEnergyPrices:\n";
        io::write_comparison_json(std::cout, comparison);

        // A repeated run is served from the cache without evaluating any formula
        RunResult again = engine.run("HighEnergyPrices");
        std::cout << "\nSecond HighEnergyPrices run from cache: " << (again.from_cache ? "yes" : "no") << "\n";

        return base.converged() && high.converged() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
