#ifndef LOOPCALC_FORMULAS_HPP
#define LOOPCALC_FORMULAS_HPP

#include "attribute.hpp"
#include <string>
#include <utility>
#include <vector>

namespace loopcalc {
namespace formulas {

// Ready-made formulas for model files and simple models.
// Each reads only the dependencies it is given or, for the aggregates, every
// declared dependency of the attribute it is attached to.

// constant + sum(coefficient * dependency)
Formula linear(double constant, std::vector<std::pair<std::string, double>> terms);

// coefficient * product of every declared dependency (coefficient alone if none)
Formula product(double coefficient);

// Smallest / largest declared dependency; throws std::domain_error with no dependencies
Formula minimum();
Formula maximum();

} // namespace formulas
} // namespace loopcalc

#endif // LOOPCALC_FORMULAS_HPP
