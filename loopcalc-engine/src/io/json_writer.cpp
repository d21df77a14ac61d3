#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace loopcalc {
namespace io {

namespace {

std::string quote(const std::string& str) {
    std::ostringstream oss;
    oss << "\"";
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    oss << "\"";
    return oss.str();
}

const char* boolean(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

void write_run_result_json(std::ostream& os, const RunResult& result,
                           bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << std::fixed << std::setprecision(6);

    os << "{" << newline;

    // Run identification
    os << indent << "\"scenario\":" << space << quote(result.scenario) << "," << newline;
    os << indent << "\"model_version\":" << space << quote(result.model_version) << "," << newline;
    os << indent << "\"fingerprint\":" << space << quote(result.fingerprint) << "," << newline;
    os << indent << "\"status\":" << space << quote(state_to_string(result.status)) << "," << newline;
    os << indent << "\"from_cache\":" << space << boolean(result.from_cache) << "," << newline;

    if (result.status == RunState::FAILED) {
        os << indent << "\"error\":" << space << "{" << newline;
        os << indent << indent << "\"message\":" << space << quote(result.error_message) << "," << newline;
        os << indent << indent << "\"attribute\":" << space << quote(result.failed_attribute) << "," << newline;
        os << indent << indent << "\"iteration\":" << space << result.failed_iteration << newline;
        os << indent << "}," << newline;
    }

    // Attribute values
    os << indent << "\"values\":" << space << "{";
    if (!result.values.empty()) {
        os << newline;
        size_t i = 0;
        for (const auto& [identity, value] : result.values) {
            os << indent << indent << quote(identity) << ":" << space << value;
            if (++i < result.values.size()) {
                os << ",";
            }
            os << newline;
        }
        os << indent;
    }
    os << "}," << newline;

    // Convergence diagnostics
    os << indent << "\"diagnostics\":" << space << "{" << newline;
    os << indent << indent << "\"all_converged\":" << space
       << boolean(result.diagnostics.all_converged()) << "," << newline;
    os << indent << indent << "\"per_group\":" << space << "[";
    const auto& groups = result.diagnostics.per_group;
    if (!groups.empty()) {
        os << newline;
        for (size_t g = 0; g < groups.size(); ++g) {
            const GroupDiagnostics& group = groups[g];
            const std::string item = indent + indent + indent;
            os << item << "{" << newline;

            os << item << indent << "\"members\":" << space << "[";
            for (size_t m = 0; m < group.members.size(); ++m) {
                if (m > 0) {
                    os << "," << space;
                }
                os << quote(group.members[m]);
            }
            os << "]," << newline;

            os << item << indent << "\"converged\":" << space << boolean(group.converged) << "," << newline;
            os << item << indent << "\"iterations\":" << space << group.iterations << "," << newline;
            os << item << indent << "\"max_delta\":" << space << group.max_delta << "," << newline;
            os << item << indent << "\"from_cache\":" << space << boolean(group.from_cache) << newline;

            os << item << "}";
            if (g + 1 < groups.size()) {
                os << ",";
            }
            os << newline;
        }
        os << indent << indent;
    }
    os << "]" << newline;
    os << indent << "}," << newline;

    // Execution metrics
    os << indent << "\"execution_time_ms\":" << space << std::fixed << std::setprecision(2)
       << result.execution_time_ms << newline;

    os << "}" << newline;
}

void write_run_result_json(const std::string& filepath, const RunResult& result,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_run_result_json(file, result, pretty_print);
}

void write_comparison_json(std::ostream& os, const ScenarioComparison& comparison,
                           bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << std::fixed << std::setprecision(6);

    os << "{" << newline;
    os << indent << "\"base_scenario\":" << space << quote(comparison.base_scenario) << "," << newline;
    os << indent << "\"other_scenario\":" << space << quote(comparison.other_scenario) << "," << newline;

    os << indent << "\"changes\":" << space << "[";
    if (!comparison.changes.empty()) {
        os << newline;
        for (size_t i = 0; i < comparison.changes.size(); ++i) {
            const AttributeChange& change = comparison.changes[i];
            os << indent << indent << "{"
               << "\"attribute\":" << space << quote(change.attribute) << "," << space
               << "\"base\":" << space << change.base_value << "," << space
               << "\"other\":" << space << change.other_value << "," << space
               << "\"delta\":" << space << change.delta << "," << space
               << "\"relative_change\":" << space;
            if (change.relative_change) {
                os << *change.relative_change;
            } else {
                os << "null";
            }
            os << "}";
            if (i + 1 < comparison.changes.size()) {
                os << ",";
            }
            os << newline;
        }
        os << indent;
    }
    os << "]" << newline;

    os << "}" << newline;
}

void write_comparison_json(const std::string& filepath, const ScenarioComparison& comparison,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_comparison_json(file, comparison, pretty_print);
}

} // namespace io
} // namespace loopcalc
