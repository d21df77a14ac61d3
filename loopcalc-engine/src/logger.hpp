/**
 * @file logger.hpp
 * @brief Structured logging for the simulation engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (scenario, fingerprint, group, iteration)
 * - Console (stderr) and file sinks
 *
 * Design Pattern: Singleton logger with structured event emission.
 * Event emission is serialized, so worker threads and concurrent runs may log freely.
 */

#ifndef LOOPCALC_LOGGER_HPP
#define LOOPCALC_LOGGER_HPP

#include "run_result.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace loopcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< State transitions, per-level timings
    INFO,    ///< Run start/end, cache hits, group convergence
    WARN,    ///< Non-converged groups, cancellations
    ERROR    ///< Formula failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    std::string scenario;       ///< Scenario being run
    std::string fingerprint;    ///< Scenario-level cache fingerprint
    std::string group;          ///< Cyclic group label ("A.x|A.y"), empty outside the solver
    size_t iteration;           ///< Solver iteration
    std::string phase;          ///< resolve, schedule, solve, cache

    LogContext() : iteration(0) {}

    LogContext(const std::string& scenario_, const std::string& fingerprint_)
        : scenario(scenario_), fingerprint(fingerprint_), iteration(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("loopcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("Base", fingerprint);
 *   Logger::get_instance().log_run_start(ctx, 3, options);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings (reopens the file sink)
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log run start with resolved input count and solver options
     */
    void log_run_start(const LogContext& ctx, size_t input_count, const RunOptions& options);

    /**
     * @brief Log a cache hit
     *
     * @param tier "scenario", "group" or "single_flight"
     */
    void log_cache_hit(const LogContext& ctx, const std::string& tier);

    /**
     * @brief Log run state machine transition
     */
    void log_state_transition(const LogContext& ctx, RunState old_state, RunState new_state);

    /**
     * @brief Log completion of one topological level
     */
    void log_level_complete(
        const LogContext& ctx,
        size_t level,
        size_t component_count,
        size_t cyclic_count,
        double elapsed_ms
    );

    /**
     * @brief Log the outcome of one cyclic group (INFO if converged, WARN otherwise)
     */
    void log_group_result(const LogContext& ctx, const GroupDiagnostics& diagnostics);

    /**
     * @brief Log run completion (ERROR if the run failed)
     */
    void log_run_complete(const LogContext& ctx, const RunResult& result);

    void log_error(const LogContext& ctx, const std::string& error_message);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace loopcalc

#endif // LOOPCALC_LOGGER_HPP
