/**
 * @file comparison.cpp
 * @brief Implementation of scenario comparison
 */

#include "comparison.hpp"
#include <cmath>
#include <stdexcept>

namespace loopcalc {

std::vector<AttributeChange> ScenarioComparison::changed(double tolerance) const {
    std::vector<AttributeChange> result;
    for (const auto& change : changes) {
        if (std::fabs(change.delta) > tolerance) {
            result.push_back(change);
        }
    }
    return result;
}

ScenarioComparison compare_results(const RunResult& base, const RunResult& other) {
    if (!base.success() || !other.success()) {
        throw std::invalid_argument("Cannot compare results without values (status " +
                                    state_to_string(base.success() ? other.status : base.status) + ")");
    }
    if (base.model_version != other.model_version) {
        throw std::invalid_argument("Cannot compare results of model versions '" + base.model_version +
                                    "' and '" + other.model_version + "'");
    }

    ScenarioComparison comparison;
    comparison.base_scenario = base.scenario;
    comparison.other_scenario = other.scenario;

    for (const auto& [identity, base_value] : base.values) {
        auto it = other.values.find(identity);
        if (it == other.values.end()) {
            throw std::invalid_argument("Attribute missing from '" + other.scenario + "': " + identity);
        }

        AttributeChange change;
        change.attribute = identity;
        change.base_value = base_value;
        change.other_value = it->second;
        change.delta = it->second - base_value;
        if (base_value != 0.0) {
            change.relative_change = change.delta / std::fabs(base_value);
        }
        comparison.changes.push_back(change);
    }

    return comparison;
}

} // namespace loopcalc
