#include "scenario_store.hpp"
#include <cmath>

namespace loopcalc {

ScenarioStore::ScenarioStore()
    : sealed_(false) {}

void ScenarioStore::define_scenario(const std::string& name, const std::map<std::string, double>& overrides) {
    if (sealed_) {
        throw RegistrySealedError("Cannot define scenario " + name + ": scenario store is sealed");
    }
    if (name.empty()) {
        throw DefinitionError("Scenario name cannot be empty");
    }
    if (scenarios_.find(name) != scenarios_.end()) {
        throw DefinitionError("Duplicate scenario: " + name);
    }
    scenarios_[name] = Scenario(name, overrides);
}

bool ScenarioStore::contains(const std::string& name) const {
    return scenarios_.find(name) != scenarios_.end();
}

const Scenario& ScenarioStore::get(const std::string& name) const {
    auto it = scenarios_.find(name);
    if (it == scenarios_.end()) {
        throw UnknownScenarioError("Unknown scenario: " + name);
    }
    return it->second;
}

std::vector<std::string> ScenarioStore::names() const {
    std::vector<std::string> result;
    result.reserve(scenarios_.size());
    for (const auto& pair : scenarios_) {
        result.push_back(pair.first);
    }
    return result;
}

void ScenarioStore::validate_scenario(const Scenario& scenario, const ModelRegistry& registry) {
    for (const auto& [identity, value] : scenario.overrides) {
        if (!registry.contains(identity)) {
            throw InvalidOverrideError(
                "Scenario '" + scenario.name + "' overrides unknown attribute: " + identity
            );
        }
        if (!registry.resolve(identity).is_input()) {
            throw InvalidOverrideError(
                "Scenario '" + scenario.name + "' overrides calculated attribute: " + identity
            );
        }
        if (!std::isfinite(value)) {
            throw InvalidOverrideError(
                "Scenario '" + scenario.name + "' overrides " + identity + " with a non-finite value"
            );
        }
    }
}

void ScenarioStore::validate(const ModelRegistry& registry) const {
    for (const auto& pair : scenarios_) {
        validate_scenario(pair.second, registry);
    }
}

void ScenarioStore::seal(const ModelRegistry& registry) {
    validate(registry);
    sealed_ = true;
}

ResolvedInputs ScenarioStore::resolve_defaults(const ModelRegistry& registry) {
    ResolvedInputs inputs;
    for (const auto& attribute : registry.attributes()) {
        if (attribute.is_input()) {
            inputs[attribute.identity] = attribute.default_value;
        }
    }
    return inputs;
}

ResolvedInputs ScenarioStore::resolve_inputs(const std::string& name, const ModelRegistry& registry) const {
    const Scenario& scenario = get(name);
    validate_scenario(scenario, registry);

    ResolvedInputs inputs = resolve_defaults(registry);
    for (const auto& [identity, value] : scenario.overrides) {
        inputs[identity] = value;
    }
    return inputs;
}

} // namespace loopcalc
