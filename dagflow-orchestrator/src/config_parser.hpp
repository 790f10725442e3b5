#ifndef DAGFLOW_CONFIG_PARSER_HPP
#define DAGFLOW_CONFIG_PARSER_HPP

#include "errors.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "workflow_model.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace dagflow {
namespace config {

/**
 * @brief Exception thrown when a workflow or runtime config file cannot be parsed
 */
class ConfigParseError : public WorkflowError {
public:
    explicit ConfigParseError(const std::string& message)
        : WorkflowError(message) {}
};

/**
 * @brief Settings for one process running workflows
 */
struct RuntimeConfig {
    OrchestratorConfig orchestrator;
    LoggerConfig logging;
};

/**
 * @brief Parses a workflow definition from a JSON string
 *
 * Accepted shape:
 *   {
 *     "id": "wf-1", "name": "optional",
 *     "definition": {
 *       "nodes": [{"id", "node_type", "node_key"?, "category"?, "config"?}],
 *       "edges": [{"source_node_id", "target_node_id", "source_port"?, "target_port"?}]
 *     }
 *   }
 * "nodes" and "edges" may also appear at the top level. Edge ports default to
 * "output" and "input". String values inside node configs have environment
 * variables expanded.
 *
 * The graph itself is not validated here; see validate_workflow().
 *
 * @param json_string Workflow as JSON text
 * @return Parsed workflow
 * @throws ConfigParseError if JSON is invalid or a required field is missing
 */
workflow::Workflow parse_workflow_from_string(const std::string& json_string);

/**
 * @brief Parses a workflow definition from a JSON file
 *
 * @throws ConfigParseError if file cannot be read or its content is invalid
 */
workflow::Workflow parse_workflow_from_file(const std::string& file_path);

/**
 * @brief Parses a workflow from an already-decoded JSON document
 *
 * @throws ConfigParseError on missing or mistyped fields
 */
workflow::Workflow parse_workflow(const nlohmann::json& document);

/**
 * @brief Parses runtime settings from a JSON string
 *
 * Every key is optional:
 *   {
 *     "failure_policy": "best_effort" | "fail_fast",
 *     "retry": {"max_retries": 0, "delay_ms": 100, "exponential_backoff": true},
 *     "logging": {"level": "INFO", "console": true, "file": "dagflow.log", "json": true}
 *   }
 *
 * @throws ConfigParseError on invalid JSON, unknown enum values or negative numbers
 */
RuntimeConfig parse_runtime_config_from_string(const std::string& json_string);

/**
 * @brief Parses runtime settings from a JSON file
 *
 * A relative logging.file is resolved against the config file's directory.
 *
 * @throws ConfigParseError if file cannot be read or its content is invalid
 */
RuntimeConfig parse_runtime_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace config
} // namespace dagflow

#endif // DAGFLOW_CONFIG_PARSER_HPP
