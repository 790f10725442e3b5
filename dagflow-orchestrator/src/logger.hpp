/**
 * @file logger.hpp
 * @brief Structured logging for workflow executions with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted lines for easy parsing, or plain text
 * - Context tracking (workflow, execution, node, phase)
 * - Thread-safe writes, since nodes of one group log concurrently
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef DAGFLOW_LOGGER_HPP
#define DAGFLOW_LOGGER_HPP

#include "execution_plan.hpp"
#include "execution_state.hpp"
#include "node_handler.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-node and per-group detail
    INFO,    ///< Execution start/end, plan summary
    WARN,    ///< Non-fatal problems (unreachable nodes, persistence warnings)
    ERROR    ///< Failed nodes and failed executions
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
 * @brief Parse log level from string
 *
 * @return INFO for unrecognised values
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Where a log line was produced
 */
struct LogContext {
    std::string workflow_id;
    std::string execution_id;
    std::string node_id;       ///< Empty for execution-level events
    std::string node_type;
    std::string phase;         ///< load, validate, plan, execute, persist

    LogContext() = default;

    LogContext(const std::string& workflow_id_, const std::string& execution_id_)
        : workflow_id(workflow_id_), execution_id(execution_id_) {}

    LogContext for_node(const std::string& node_id_, const std::string& node_type_) const {
        LogContext ctx = *this;
        ctx.node_id = node_id_;
        ctx.node_type = node_type_;
        ctx.phase = "execute";
        return ctx;
    }

    LogContext in_phase(const std::string& phase_) const {
        LogContext ctx = *this;
        ctx.phase = phase_;
        return ctx;
    }
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended to)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("dagflow.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Every line carries timestamp, level, message and event, plus whichever
 * context fields are non-empty.
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "dagflow.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("wf-1", "exec-1");
 *   logger.log_execution_start(ctx, "scheduler", 4);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of an execution
     *
     * @param ctx Execution context
     * @param triggered_by Who or what started the execution
     * @param node_count Number of nodes in the workflow
     */
    void log_execution_start(const LogContext& ctx, const std::string& triggered_by, size_t node_count);

    void log_validation_warnings(const LogContext& ctx, const std::vector<std::string>& warnings);

    /**
     * @brief Log a freshly built plan (group count, sizes, estimate)
     */
    void log_plan_built(const LogContext& ctx, const workflow::ExecutionPlan& plan);

    void log_group_start(const LogContext& ctx, size_t group_index, size_t group_size);

    void log_group_complete(const LogContext& ctx, size_t group_index, size_t failed_count, double duration_ms);

    /**
     * @brief Log the outcome of one node
     *
     * Successful nodes log at DEBUG, failed nodes at ERROR.
     *
     * @param ctx Node context (see LogContext::for_node)
     * @param result Node result including latency and retry count
     */
    void log_node_complete(const LogContext& ctx, const NodeExecutionResult& result);

    /**
     * @brief Log a completed execution
     *
     * @param ctx Execution context
     * @param execution The completed record
     * @param duration_ms Wall-clock duration of the whole execution
     */
    void log_execution_complete(const LogContext& ctx, const WorkflowExecution& execution, double duration_ms);

    /**
     * @brief Log an execution that failed with an orchestration fault
     */
    void log_execution_failed(const LogContext& ctx, const std::string& error_message, const std::string& stack);

    void log_state_transition(const LogContext& ctx, ExecutionStatus old_status, ExecutionStatus new_status);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Log error with context
     *
     * @param ctx Context
     * @param error_message Error message
     * @param stack_trace Optional error type/phase description
     */
    void log_error(const LogContext& ctx, const std::string& error_message, const std::string& stack_trace = "");

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

    void log(LogLevel level, const std::string& message, const LogContext& ctx,
             std::map<std::string, std::string> fields);
    std::string format_line(LogLevel level, const std::string& message,
                            const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace dagflow

#endif // DAGFLOW_LOGGER_HPP
