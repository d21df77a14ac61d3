#ifndef LOOPCALC_IO_JSON_WRITER_HPP
#define LOOPCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../comparison.hpp"
#include "../run_result.hpp"

namespace loopcalc {
namespace io {

// Write RunResult to JSON format
// The output includes status, every attribute value, per-group diagnostics and timing
void write_run_result_json(std::ostream& os, const RunResult& result,
                           bool pretty_print = true);

// Write RunResult to JSON file
void write_run_result_json(const std::string& filepath, const RunResult& result,
                           bool pretty_print = true);

// Write ScenarioComparison to JSON format (relative_change is null for a zero base)
void write_comparison_json(std::ostream& os, const ScenarioComparison& comparison,
                           bool pretty_print = true);

void write_comparison_json(const std::string& filepath, const ScenarioComparison& comparison,
                           bool pretty_print = true);

} // namespace io
} // namespace loopcalc

#endif // LOOPCALC_IO_JSON_WRITER_HPP
