/**
 * @file simulation_engine.hpp
 * @brief Facade composing registry, scenarios, graph analysis, scheduler and cache
 *
 * The SimulationEngine is responsible for:
 * - Building the dependency graph and its levelled condensation once per model
 * - Resolving a scenario into a total input mapping
 * - Consulting the scenario-level cache (single-flight per fingerprint)
 * - Running the scheduler on a miss and storing cacheable results
 * - Logging run start and completion
 */

#ifndef LOOPCALC_SIMULATION_ENGINE_HPP
#define LOOPCALC_SIMULATION_ENGINE_HPP

#include "cache_manager.hpp"
#include "dependency_graph.hpp"
#include "evaluation_scheduler.hpp"
#include "graph_analyzer.hpp"
#include "logger.hpp"
#include "model_registry.hpp"
#include "run_result.hpp"
#include "scenario_store.hpp"
#include <memory>
#include <string>

namespace loopcalc {

/**
 * @brief Runs scenarios of one sealed model
 *
 * Deterministic for a fixed (model version, scenario, options). Safe to call
 * run() from several threads at once: each run owns its values, and the
 * cache is the only shared state.
 *
 * Usage Example:
 *   @code
 *   ModelRegistry registry = build_model();
 *   ScenarioStore scenarios;
 *   scenarios.define_scenario("HighEnergyPrices", {{"Production.energyCost", 90.0}});
 *   scenarios.seal(registry);
 *
 *   SimulationEngine engine(registry, scenarios);
 *   RunResult result = engine.run("HighEnergyPrices");
 *   if (result.success()) {
 *       std::cout << result.value("Production.co2Cost") << std::endl;
 *   }
 *   @endcode
 */
class SimulationEngine {
public:
    /**
     * @brief Constructor
     *
     * The registry and store must outlive the engine.
     *
     * @param registry Sealed model registry
     * @param scenarios Scenario store (validated against the registry)
     * @param cache Shared cache (optional, the engine owns a private one if nullptr)
     * @param logger Logger instance (optional, uses the singleton if nullptr)
     * @throws DefinitionError if the registry is not sealed or a scenario is invalid
     */
    SimulationEngine(
        const ModelRegistry& registry,
        const ScenarioStore& scenarios,
        CacheManager* cache = nullptr,
        Logger* logger = nullptr
    );

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    /**
     * @brief Evaluate a named scenario
     *
     * Formula failures and cancellations come back as FAILED / CANCELLED
     * results, never as exceptions.
     *
     * @throws UnknownScenarioError if the scenario is not defined
     * @throws std::invalid_argument on invalid options
     */
    RunResult run(const std::string& scenario, const RunOptions& options = RunOptions()) const;

    /**
     * @brief Evaluate the model defaults, labelled `label`
     */
    RunResult run_defaults(const std::string& label, const RunOptions& options = RunOptions()) const;

    /**
     * @brief Evaluate an explicit, total input mapping, labelled `label`
     *
     * @throws DefinitionError if an input attribute is missing
     * @throws InvalidOverrideError if a key is unknown or not an input
     */
    RunResult run_inputs(
        const std::string& label,
        const ResolvedInputs& inputs,
        const RunOptions& options = RunOptions()
    ) const;

    /**
     * @brief Drop cached results that depend on one input attribute
     *
     * @return Number of cache entries removed
     */
    size_t invalidate_input(const std::string& input_identity);

    const ModelRegistry& registry() const { return registry_; }
    const ScenarioStore& scenarios() const { return scenarios_; }
    const DependencyGraph& graph() const { return graph_; }
    const AnalyzedGraph& analysis() const { return analysis_; }
    CacheManager& cache() const { return *cache_; }

private:
    const ModelRegistry& registry_;
    const ScenarioStore& scenarios_;
    std::unique_ptr<CacheManager> owned_cache_;
    CacheManager* cache_;
    Logger* logger_;
    DependencyGraph graph_;
    AnalyzedGraph analysis_;
    std::unique_ptr<EvaluationScheduler> scheduler_;

    void check_inputs(const ResolvedInputs& inputs) const;
    RunResult execute(const std::string& label, const ResolvedInputs& inputs, const RunOptions& options) const;
};

} // namespace loopcalc

#endif // LOOPCALC_SIMULATION_ENGINE_HPP
