/**
 * @file json_codec.hpp
 * @brief JSON views of engine records
 *
 * Conversions follow nlohmann/json's ADL convention, so any record can be
 * assigned directly: `nlohmann::json j = execution;`. Timestamps are ISO-8601
 * UTC with millisecond precision ("2024-01-31T12:00:00.000Z").
 */

#ifndef DAGFLOW_JSON_CODEC_HPP
#define DAGFLOW_JSON_CODEC_HPP

#include "dag_validator.hpp"
#include "execution_plan.hpp"
#include "execution_state.hpp"
#include "node_handler.hpp"
#include "stores.hpp"
#include "workflow_model.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace dagflow {

std::string format_timestamp(Timestamp timestamp);

/**
 * @brief Parse a timestamp produced by format_timestamp()
 *
 * Accepts an optional fractional part; the trailing 'Z' is required.
 *
 * @throws std::invalid_argument On malformed input
 */
Timestamp parse_timestamp(const std::string& value);

void to_json(nlohmann::json& j, const NodeError& error);
void to_json(nlohmann::json& j, const NodeExecutionResult& result);
void to_json(nlohmann::json& j, const ExecutionErrorData& error);
void to_json(nlohmann::json& j, const WorkflowExecution& execution);
void to_json(nlohmann::json& j, const NodeLogRecord& record);

namespace workflow {

void to_json(nlohmann::json& j, const WorkflowNode& node);
void to_json(nlohmann::json& j, const WorkflowEdge& edge);
void to_json(nlohmann::json& j, const Workflow& workflow);
void to_json(nlohmann::json& j, const ExecutionStep& step);
void to_json(nlohmann::json& j, const ExecutionPlan& plan);
void to_json(nlohmann::json& j, const DAGValidationResult& result);

} // namespace workflow
} // namespace dagflow

#endif // DAGFLOW_JSON_CODEC_HPP
