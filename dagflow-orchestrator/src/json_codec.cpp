#include "json_codec.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace dagflow {

std::string format_timestamp(Timestamp timestamp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()
    ) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time_t_value;
    }

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

Timestamp parse_timestamp(const std::string& value) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        throw std::invalid_argument("Malformed timestamp: " + value);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("Timestamp out of range: " + value);
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (value[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Malformed timestamp: " + value);
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    if (pos + 1 != value.size() || value[pos] != 'Z') {
        throw std::invalid_argument("Timestamp must be UTC ('Z'): " + value);
    }

    int64_t seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
        + hour * 3600 + minute * 60 + second;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(seconds * 1000 + millis)));
}

void to_json(json& j, const NodeError& error) {
    j = json{
        {"message", error.message},
        {"code", error.code},
        {"details", error.details}
    };
}

void to_json(json& j, const NodeExecutionResult& result) {
    j = json::object();
    j["success"] = result.success;
    if (result.success) {
        j["output"] = result.output;
    } else if (result.error) {
        j["error"] = *result.error;
    }
    j["metadata"] = {
        {"latency_ms", result.metadata.latency_ms},
        {"retry_count", result.metadata.retry_count}
    };
}

void to_json(json& j, const ExecutionErrorData& error) {
    j = json{{"message", error.message}, {"stack", error.stack}};
}

void to_json(json& j, const WorkflowExecution& execution) {
    j = json::object();
    j["id"] = execution.id;
    j["workflow_id"] = execution.workflow_id;
    j["status"] = status_to_string(execution.status);
    j["triggered_by"] = execution.triggered_by;
    j["input_data"] = execution.input_data;
    j["result_data"] = execution.result_data;
    j["error_data"] = execution.error_data ? json(*execution.error_data) : json(nullptr);
    j["started_at"] = format_timestamp(execution.started_at);
    j["completed_at"] = execution.completed_at ? json(format_timestamp(*execution.completed_at)) : json(nullptr);
    j["has_node_failures"] = execution.has_node_failures;
    j["failed_nodes"] = execution.failed_nodes;

    json node_results = json::object();
    for (const auto& [node_id, result] : execution.node_results) {
        node_results[node_id] = result;
    }
    j["node_results"] = node_results;

    if (!execution.warnings.empty()) {
        j["warnings"] = execution.warnings;
    }
}

void to_json(json& j, const NodeLogRecord& record) {
    j = json{
        {"execution_id", record.execution_id},
        {"node_id", record.node_id},
        {"node_key", record.node_key},
        {"node_type", record.node_type},
        {"status", record.status},
        {"output_data", record.output_data},
        {"error_data", record.error_data},
        {"latency_ms", record.latency_ms},
        {"completed_at", format_timestamp(record.completed_at)}
    };
}

namespace workflow {

void to_json(json& j, const WorkflowNode& node) {
    j = json{
        {"id", node.id},
        {"node_type", node.node_type},
        {"config", node.config}
    };
    if (!node.node_key.empty()) {
        j["node_key"] = node.node_key;
    }
    if (!node.category.empty()) {
        j["category"] = node.category;
    }
}

void to_json(json& j, const WorkflowEdge& edge) {
    j = json{
        {"source_node_id", edge.source_node_id},
        {"target_node_id", edge.target_node_id},
        {"source_port", edge.source_port},
        {"target_port", edge.target_port}
    };
}

void to_json(json& j, const Workflow& workflow) {
    j = json{
        {"id", workflow.id},
        {"name", workflow.name},
        {"definition", {
            {"nodes", workflow.definition.nodes},
            {"edges", workflow.definition.edges}
        }}
    };
}

void to_json(json& j, const ExecutionStep& step) {
    j = json{
        {"node_id", step.node_id},
        {"dependencies", step.dependencies},
        {"can_run_in_parallel", step.can_run_in_parallel},
        {"estimated_duration_ms", step.estimated_duration_ms}
    };
}

void to_json(json& j, const ExecutionPlan& plan) {
    j = json{
        {"steps", plan.steps},
        {"parallel_groups", plan.parallel_groups},
        {"estimated_duration_ms", plan.estimated_duration_ms}
    };
}

void to_json(json& j, const DAGValidationResult& result) {
    j = json{
        {"valid", result.valid},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"cycles", result.cycles},
        {"unreachable_nodes", result.unreachable_nodes}
    };
}

} // namespace workflow
} // namespace dagflow
