/**
 * @file comparison.hpp
 * @brief Attribute-by-attribute comparison of two run results
 */

#ifndef LOOPCALC_COMPARISON_HPP
#define LOOPCALC_COMPARISON_HPP

#include "run_result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace loopcalc {

/**
 * @brief Change of one attribute between two scenarios
 */
struct AttributeChange {
    std::string attribute;
    double base_value;
    double other_value;
    double delta;                           ///< other - base
    std::optional<double> relative_change;  ///< delta / |base|, unset when base is 0

    AttributeChange() : base_value(0.0), other_value(0.0), delta(0.0) {}
};

/**
 * @brief Comparison of a scenario against a base scenario
 */
struct ScenarioComparison {
    std::string base_scenario;
    std::string other_scenario;
    std::vector<AttributeChange> changes;   ///< Every attribute, ordered by identity

    /// Attributes whose absolute delta exceeds `tolerance`
    std::vector<AttributeChange> changed(double tolerance = 0.0) const;
};

/**
 * @brief Compare two successful results of the same model
 *
 * @throws std::invalid_argument if either result carries no values, or the
 *         results come from different model versions
 */
ScenarioComparison compare_results(const RunResult& base, const RunResult& other);

} // namespace loopcalc

#endif // LOOPCALC_COMPARISON_HPP
