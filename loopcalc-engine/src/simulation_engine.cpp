/**
 * @file simulation_engine.cpp
 * @brief Implementation of SimulationEngine
 */

#include "simulation_engine.hpp"
#include "fingerprint.hpp"
#include <cmath>

namespace loopcalc {

SimulationEngine::SimulationEngine(
    const ModelRegistry& registry,
    const ScenarioStore& scenarios,
    CacheManager* cache,
    Logger* logger
)
    : registry_(registry),
      scenarios_(scenarios),
      cache_(cache),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (!cache_) {
        owned_cache_ = std::make_unique<CacheManager>();
        cache_ = owned_cache_.get();
    }

    if (!registry_.is_sealed()) {
        throw DefinitionError("SimulationEngine requires a sealed model registry");
    }
    scenarios_.validate(registry_);

    graph_ = build_dependency_graph(registry_);
    analysis_ = analyze_graph(graph_);
    scheduler_ = std::make_unique<EvaluationScheduler>(registry_, graph_, analysis_, logger_);
}

RunResult SimulationEngine::run(const std::string& scenario, const RunOptions& options) const {
    ResolvedInputs inputs = scenarios_.resolve_inputs(scenario, registry_);
    return execute(scenario, inputs, options);
}

RunResult SimulationEngine::run_defaults(const std::string& label, const RunOptions& options) const {
    return execute(label, ScenarioStore::resolve_defaults(registry_), options);
}

RunResult SimulationEngine::run_inputs(
    const std::string& label,
    const ResolvedInputs& inputs,
    const RunOptions& options
) const {
    check_inputs(inputs);
    return execute(label, inputs, options);
}

void SimulationEngine::check_inputs(const ResolvedInputs& inputs) const {
    for (const auto& [identity, value] : inputs) {
        if (!registry_.contains(identity)) {
            throw InvalidOverrideError("Unknown input attribute: " + identity);
        }
        if (!registry_.resolve(identity).is_input()) {
            throw InvalidOverrideError("Cannot supply a value for calculated attribute: " + identity);
        }
        if (!std::isfinite(value)) {
            throw InvalidOverrideError("Non-finite value for input attribute: " + identity);
        }
    }
    for (const auto& identity : registry_.input_identities()) {
        if (inputs.find(identity) == inputs.end()) {
            throw DefinitionError("Missing value for input attribute: " + identity);
        }
    }
}

RunResult SimulationEngine::execute(
    const std::string& label,
    const ResolvedInputs& inputs,
    const RunOptions& options
) const {
    options.validate();

    std::string fingerprint = scenario_fingerprint(registry_.version(), label, inputs, options);
    LogContext ctx(label, fingerprint);
    ctx.phase = "run";

    logger_->log_run_start(ctx, inputs.size(), options);

    RunResult result;
    if (options.use_cache) {
        result = cache_->get_or_compute(fingerprint, [&]() {
            return scheduler_->run(inputs, options, ctx, cache_);
        });
        if (result.from_cache) {
            logger_->log_cache_hit(ctx, "scenario");
        }
    } else {
        result = scheduler_->run(inputs, options, ctx, nullptr);
    }

    logger_->log_run_complete(ctx, result);
    return result;
}

size_t SimulationEngine::invalidate_input(const std::string& input_identity) {
    const Attribute& attribute = registry_.resolve(input_identity);
    if (!attribute.is_input()) {
        throw InvalidOverrideError("Not an input attribute: " + input_identity);
    }
    return cache_->invalidate_input(registry_.version(), input_identity);
}

} // namespace loopcalc
