/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "json_codec.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <sstream>

namespace dagflow {

namespace {

std::string format_ms(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << value;
    return oss.str();
}

} // namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_(LoggerConfig()) {}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_execution_start(const LogContext& ctx, const std::string& triggered_by, size_t node_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "execution_start";
    fields["triggered_by"] = triggered_by;
    fields["node_count"] = std::to_string(node_count);

    log(LogLevel::INFO, "Starting workflow execution", ctx, std::move(fields));
}

void Logger::log_validation_warnings(const LogContext& ctx, const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        std::map<std::string, std::string> fields;
        fields["event"] = "validation_warning";
        fields["warning"] = warning;
        log(LogLevel::WARN, warning, ctx, std::move(fields));
    }
}

void Logger::log_plan_built(const LogContext& ctx, const workflow::ExecutionPlan& plan) {
    std::map<std::string, std::string> fields;
    fields["event"] = "plan_built";
    fields["group_count"] = std::to_string(plan.parallel_groups.size());
    fields["step_count"] = std::to_string(plan.steps.size());
    fields["estimated_duration_ms"] = std::to_string(plan.estimated_duration_ms);

    std::string sizes;
    for (const auto& group : plan.parallel_groups) {
        if (!sizes.empty()) sizes += ",";
        sizes += std::to_string(group.size());
    }
    fields["group_sizes"] = sizes;

    log(LogLevel::INFO, "Execution plan built", ctx, std::move(fields));
}

void Logger::log_group_start(const LogContext& ctx, size_t group_index, size_t group_size) {
    std::map<std::string, std::string> fields;
    fields["event"] = "group_start";
    fields["group_index"] = std::to_string(group_index);
    fields["group_size"] = std::to_string(group_size);

    log(LogLevel::DEBUG, "Dispatching group", ctx, std::move(fields));
}

void Logger::log_group_complete(const LogContext& ctx, size_t group_index, size_t failed_count, double duration_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "group_complete";
    fields["group_index"] = std::to_string(group_index);
    fields["failed_count"] = std::to_string(failed_count);
    fields["duration_ms"] = format_ms(duration_ms);

    log(failed_count > 0 ? LogLevel::WARN : LogLevel::DEBUG, "Group joined", ctx, std::move(fields));
}

void Logger::log_node_complete(const LogContext& ctx, const NodeExecutionResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "node_complete";
    fields["success"] = result.success ? "true" : "false";
    fields["latency_ms"] = format_ms(result.metadata.latency_ms);
    fields["retry_count"] = std::to_string(result.metadata.retry_count);

    if (!result.success && result.error) {
        fields["error"] = result.error->message;
        fields["error_code"] = result.error->code;
    }

    log(result.success ? LogLevel::DEBUG : LogLevel::ERROR,
        result.success ? "Node completed" : "Node failed", ctx, std::move(fields));
}

void Logger::log_execution_complete(const LogContext& ctx, const WorkflowExecution& execution, double duration_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "execution_complete";
    fields["status"] = status_to_string(execution.status);
    fields["node_count"] = std::to_string(execution.node_results.size());
    fields["failed_count"] = std::to_string(execution.failed_nodes.size());
    fields["has_node_failures"] = execution.has_node_failures ? "true" : "false";
    fields["duration_ms"] = format_ms(duration_ms);

    if (!execution.warnings.empty()) {
        fields["warning_count"] = std::to_string(execution.warnings.size());
    }

    log(execution.has_node_failures ? LogLevel::WARN : LogLevel::INFO,
        "Workflow execution completed", ctx, std::move(fields));
}

void Logger::log_execution_failed(const LogContext& ctx, const std::string& error_message, const std::string& stack) {
    std::map<std::string, std::string> fields;
    fields["event"] = "execution_failed";
    fields["error_message"] = error_message;
    if (!stack.empty()) {
        fields["stack"] = stack;
    }

    log(LogLevel::ERROR, "Workflow execution failed", ctx, std::move(fields));
}

void Logger::log_state_transition(const LogContext& ctx, ExecutionStatus old_status, ExecutionStatus new_status) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    fields["old_state"] = status_to_string(old_status);
    fields["new_state"] = status_to_string(new_status);

    log(LogLevel::DEBUG, "State transition", ctx, std::move(fields));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, ctx, std::move(fields));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message, const std::string& stack_trace) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;
    if (!stack_trace.empty()) {
        fields["stack_trace"] = stack_trace;
    }

    log(LogLevel::ERROR, error_message, ctx, std::move(fields));
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

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(LogLevel level, const std::string& message, const LogContext& ctx,
                 std::map<std::string, std::string> fields) {
    if (!ctx.workflow_id.empty()) fields["workflow_id"] = ctx.workflow_id;
    if (!ctx.execution_id.empty()) fields["execution_id"] = ctx.execution_id;
    if (!ctx.node_id.empty()) fields["node_id"] = ctx.node_id;
    if (!ctx.node_type.empty()) fields["node_type"] = ctx.node_type;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }
    write_output(format_line(level, message, fields));
}

std::string Logger::format_line(LogLevel level, const std::string& message,
                                const std::map<std::string, std::string>& fields) const {
    const std::string timestamp = format_timestamp(std::chrono::system_clock::now());

    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = timestamp;
        line["level"] = level_to_string(level);
        line["message"] = message;
        // Lines may carry handler-provided text; never throw on invalid UTF-8
        return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;
    oss << timestamp << " [" << level_to_string(level) << "] " << message;
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

} // namespace dagflow
