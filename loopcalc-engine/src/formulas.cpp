#include "formulas.hpp"
#include <algorithm>
#include <stdexcept>

namespace loopcalc {
namespace formulas {

Formula linear(double constant, std::vector<std::pair<std::string, double>> terms) {
    return [constant, terms = std::move(terms)](const DependencySnapshot& deps) {
        double total = constant;
        for (const auto& [name, coefficient] : terms) {
            total += coefficient * deps.get(name);
        }
        return total;
    };
}

Formula product(double coefficient) {
    return [coefficient](const DependencySnapshot& deps) {
        double total = coefficient;
        for (size_t i = 0; i < deps.size(); ++i) {
            total *= deps.at(i);
        }
        return total;
    };
}

Formula minimum() {
    return [](const DependencySnapshot& deps) {
        if (deps.size() == 0) {
            throw std::domain_error("min over no dependencies");
        }
        double result = deps.at(0);
        for (size_t i = 1; i < deps.size(); ++i) {
            result = std::min(result, deps.at(i));
        }
        return result;
    };
}

Formula maximum() {
    return [](const DependencySnapshot& deps) {
        if (deps.size() == 0) {
            throw std::domain_error("max over no dependencies");
        }
        double result = deps.at(0);
        for (size_t i = 1; i < deps.size(); ++i) {
            result = std::max(result, deps.at(i));
        }
        return result;
    };
}

} // namespace formulas
} // namespace loopcalc
