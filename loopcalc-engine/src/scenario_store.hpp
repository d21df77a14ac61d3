#ifndef LOOPCALC_SCENARIO_STORE_HPP
#define LOOPCALC_SCENARIO_STORE_HPP

#include "model_registry.hpp"
#include <map>
#include <string>
#include <vector>

namespace loopcalc {

// Effective value of every input attribute for one run, ordered by identity
using ResolvedInputs = std::map<std::string, double>;

// Scenario: named set of input overrides keyed by qualified identity
struct Scenario {
    std::string name;
    std::map<std::string, double> overrides;

    Scenario() = default;
    Scenario(const std::string& name_, const std::map<std::string, double>& overrides_)
        : name(name_), overrides(overrides_) {}
};

// ScenarioStore: named override sets, resolved against a model registry.
// Resolution is layered: input defaults first, then the scenario's overrides.
class ScenarioStore {
public:
    ScenarioStore();

    // Register a scenario. Override keys must be qualified identities.
    // Throws DefinitionError on an empty or duplicate name, RegistrySealedError after seal().
    void define_scenario(const std::string& name, const std::map<std::string, double>& overrides);

    bool contains(const std::string& name) const;
    const Scenario& get(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return scenarios_.size(); }

    // Check every scenario against the registry; throws InvalidOverrideError
    void validate(const ModelRegistry& registry) const;

    // Check then freeze the store
    void seal(const ModelRegistry& registry);
    bool is_sealed() const { return sealed_; }

    // Defaults of every input, then the scenario's overrides (override wins).
    // Throws UnknownScenarioError or InvalidOverrideError.
    ResolvedInputs resolve_inputs(const std::string& name, const ModelRegistry& registry) const;

    // Defaults only
    static ResolvedInputs resolve_defaults(const ModelRegistry& registry);

private:
    std::map<std::string, Scenario> scenarios_;
    bool sealed_;

    static void validate_scenario(const Scenario& scenario, const ModelRegistry& registry);
};

} // namespace loopcalc

#endif // LOOPCALC_SCENARIO_STORE_HPP
