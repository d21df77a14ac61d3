/**
 * @file run_result.hpp
 * @brief Run options, run state machine and run result types
 */

#ifndef LOOPCALC_RUN_RESULT_HPP
#define LOOPCALC_RUN_RESULT_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace loopcalc {

/**
 * @brief Evaluation state of one run
 *
 * INITIALIZING -> LEVEL_PROCESSING -> (CONVERGING)* -> DONE | EXHAUSTED | FAILED | CANCELLED
 */
enum class RunState {
    INITIALIZING,       ///< Binding inputs
    LEVEL_PROCESSING,   ///< Evaluating one topological level
    CONVERGING,         ///< Iterating the cyclic groups of the current level
    DONE,               ///< All groups converged
    EXHAUSTED,          ///< Finished, but at least one group hit max_iterations
    FAILED,             ///< A formula failed; no values
    CANCELLED           ///< Cancelled or past its deadline; no values
};

inline std::string state_to_string(RunState state) {
    switch (state) {
        case RunState::INITIALIZING: return "INITIALIZING";
        case RunState::LEVEL_PROCESSING: return "LEVEL_PROCESSING";
        case RunState::CONVERGING: return "CONVERGING";
        case RunState::DONE: return "DONE";
        case RunState::EXHAUSTED: return "EXHAUSTED";
        case RunState::FAILED: return "FAILED";
        case RunState::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Per-run solver and scheduling options
 */
struct RunOptions {
    size_t max_iterations;                                          ///< Deterministic cap per cyclic group
    double threshold;                                               ///< Converged when max delta < threshold
    std::optional<std::chrono::steady_clock::time_point> deadline;  ///< Wall-clock limit, checked between iterations
    const std::atomic<bool>* cancel_flag;                           ///< Set to true to cancel (not owned)
    bool use_cache;                                                 ///< Consult and populate the cache
    bool parallel;                                                  ///< Evaluate each level on the worker pool
    bool warm_start;                                                ///< Start groups from their last cached values

    RunOptions()
        : max_iterations(100),
          threshold(0.001),
          cancel_flag(nullptr),
          use_cache(true),
          parallel(true),
          warm_start(false) {}

    bool cancelled() const {
        return cancel_flag != nullptr && cancel_flag->load();
    }

    bool past_deadline() const {
        return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
    }

    /// @throws std::invalid_argument on a zero iteration cap or a non-positive threshold
    void validate() const;
};

/**
 * @brief Convergence outcome of one cyclic group
 */
struct GroupDiagnostics {
    std::vector<std::string> members;   ///< Identities, update order
    bool converged;
    size_t iterations;
    double max_delta;                   ///< Largest change in the final iteration
    bool cancelled;                     ///< Interrupted by cancellation or deadline
    bool from_cache;                    ///< Values reused from the group cache

    GroupDiagnostics()
        : converged(false), iterations(0), max_delta(0.0), cancelled(false), from_cache(false) {}
};

struct RunDiagnostics {
    std::vector<GroupDiagnostics> per_group;    ///< Cyclic groups in topological order

    bool all_converged() const;
    size_t not_converged_count() const;
};

/**
 * @brief Outcome of SimulationEngine::run
 */
struct RunResult {
    std::string scenario;
    std::string model_version;
    std::string fingerprint;
    RunState status;
    std::map<std::string, double> values;   ///< Every attribute, empty unless DONE or EXHAUSTED
    RunDiagnostics diagnostics;
    std::vector<RunState> state_trace;      ///< States entered, in order
    std::string error_message;
    std::string failed_attribute;
    size_t failed_iteration;
    bool from_cache;
    double execution_time_ms;

    RunResult()
        : status(RunState::INITIALIZING),
          failed_iteration(0),
          from_cache(false),
          execution_time_ms(0.0) {}

    bool success() const { return status == RunState::DONE || status == RunState::EXHAUSTED; }
    bool converged() const { return status == RunState::DONE; }

    /// @throws std::out_of_range if the attribute has no value
    double value(const std::string& identity) const;
};

} // namespace loopcalc

#endif // LOOPCALC_RUN_RESULT_HPP
