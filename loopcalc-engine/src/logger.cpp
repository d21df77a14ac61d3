/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace loopcalc {

namespace {

std::string join_members(const std::vector<std::string>& members) {
    std::string joined;
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) joined += "|";
        joined += members[i];
    }
    return joined;
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    fields["scenario"] = ctx.scenario;
    if (!ctx.fingerprint.empty()) {
        fields["fingerprint"] = ctx.fingerprint;
    }
    if (!ctx.group.empty()) {
        fields["group"] = ctx.group;
        fields["iteration"] = std::to_string(ctx.iteration);
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

void Logger::log_run_start(const LogContext& ctx, size_t input_count, const RunOptions& options) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    add_context(fields, ctx);
    fields["input_count"] = std::to_string(input_count);
    fields["max_iterations"] = std::to_string(options.max_iterations);
    fields["threshold"] = std::to_string(options.threshold);
    fields["parallel"] = options.parallel ? "true" : "false";
    fields["use_cache"] = options.use_cache ? "true" : "false";
    fields["has_deadline"] = options.deadline.has_value() ? "true" : "false";

    log(LogLevel::INFO, "Starting run", std::move(fields));
}

void Logger::log_cache_hit(const LogContext& ctx, const std::string& tier) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_hit";
    add_context(fields, ctx);
    fields["tier"] = tier;

    log(tier == "group" ? LogLevel::DEBUG : LogLevel::INFO, "Cache hit", std::move(fields));
}

void Logger::log_state_transition(const LogContext& ctx, RunState old_state, RunState new_state) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    add_context(fields, ctx);
    fields["old_state"] = state_to_string(old_state);
    fields["new_state"] = state_to_string(new_state);

    log(LogLevel::DEBUG, "State transition", std::move(fields));
}

void Logger::log_level_complete(
    const LogContext& ctx,
    size_t level,
    size_t component_count,
    size_t cyclic_count,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "level_complete";
    add_context(fields, ctx);
    fields["level"] = std::to_string(level);
    fields["component_count"] = std::to_string(component_count);
    fields["cyclic_count"] = std::to_string(cyclic_count);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::DEBUG, "Level complete", std::move(fields));
}

void Logger::log_group_result(const LogContext& ctx, const GroupDiagnostics& diagnostics) {
    std::map<std::string, std::string> fields;
    fields["event"] = diagnostics.converged ? "group_converged" : "group_not_converged";
    add_context(fields, ctx);
    fields["group"] = join_members(diagnostics.members);
    fields["iterations"] = std::to_string(diagnostics.iterations);
    fields["max_delta"] = std::to_string(diagnostics.max_delta);
    fields["from_cache"] = diagnostics.from_cache ? "true" : "false";
    if (diagnostics.cancelled) {
        fields["cancelled"] = "true";
    }

    if (diagnostics.converged) {
        log(LogLevel::INFO, "Converged in " + std::to_string(diagnostics.iterations) + " iterations",
            std::move(fields));
    } else {
        log(LogLevel::WARN, "Not converged after " + std::to_string(diagnostics.iterations) + " iterations",
            std::move(fields));
    }
}

void Logger::log_run_complete(const LogContext& ctx, const RunResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    add_context(fields, ctx);
    fields["status"] = state_to_string(result.status);
    fields["from_cache"] = result.from_cache ? "true" : "false";
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["attribute_count"] = std::to_string(result.values.size());
    fields["group_count"] = std::to_string(result.diagnostics.per_group.size());
    fields["not_converged_count"] = std::to_string(result.diagnostics.not_converged_count());

    if (!result.error_message.empty()) {
        fields["error"] = result.error_message;
    }
    if (!result.failed_attribute.empty()) {
        fields["failed_attribute"] = result.failed_attribute;
        fields["failed_iteration"] = std::to_string(result.failed_iteration);
    }

    LogLevel level = LogLevel::INFO;
    if (result.status == RunState::FAILED) {
        level = LogLevel::ERROR;
    } else if (result.status == RunState::CANCELLED || result.status == RunState::EXHAUSTED) {
        level = LogLevel::WARN;
    }
    log(level, "Run completed", std::move(fields));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run error", std::move(fields));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
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
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace loopcalc
