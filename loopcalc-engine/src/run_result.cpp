#include "run_result.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace loopcalc {

void RunOptions::validate() const {
    if (max_iterations == 0) {
        throw std::invalid_argument("max_iterations must be at least 1");
    }
    if (!(threshold > 0.0) || !std::isfinite(threshold)) {
        throw std::invalid_argument("threshold must be a positive finite number");
    }
}

bool RunDiagnostics::all_converged() const {
    return not_converged_count() == 0;
}

size_t RunDiagnostics::not_converged_count() const {
    return static_cast<size_t>(std::count_if(per_group.begin(), per_group.end(),
        [](const GroupDiagnostics& g) { return !g.converged; }));
}

double RunResult::value(const std::string& identity) const {
    auto it = values.find(identity);
    if (it == values.end()) {
        throw std::out_of_range("No value for attribute: " + identity);
    }
    return it->second;
}

} // namespace loopcalc
