/**
 * @file errors.hpp
 * @brief Exception hierarchy for workflow validation, persistence and orchestration
 *
 * Propagation rules:
 * - ValidationError / NotFoundError: fail fast, no execution record is created
 * - NodeExecutionError: thrown by handlers, always captured into a failed node result
 * - PersistenceError: raised by stores and sinks; fatal only when creating a record
 * - OrchestrationError: marks the execution failed and is re-thrown to the caller
 */

#ifndef DAGFLOW_ERRORS_HPP
#define DAGFLOW_ERRORS_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dagflow {

/**
 * @brief Base exception for all workflow engine errors
 */
class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a workflow fails DAG or shape checks
 *
 * Carries the validator's error list so callers can render each problem.
 */
class ValidationError : public WorkflowError {
public:
    explicit ValidationError(const std::vector<std::string>& errors)
        : WorkflowError("Invalid workflow: " + join(errors)), errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;

    static std::string join(const std::vector<std::string>& errors) {
        std::string joined;
        for (const auto& error : errors) {
            if (!joined.empty()) joined += ", ";
            joined += error;
        }
        return joined;
    }
};

/**
 * @brief Raised when a workflow id cannot be resolved
 */
class NotFoundError : public WorkflowError {
public:
    explicit NotFoundError(const std::string& message)
        : WorkflowError(message) {}
};

/**
 * @brief Raised when an underlying store or sink read/write fails
 */
class PersistenceError : public WorkflowError {
public:
    explicit PersistenceError(const std::string& message)
        : WorkflowError("Persistence error: " + message) {}
};

/**
 * @brief Raised by node handlers to report a structured failure
 *
 * The node executor copies code() and details() into the failed result.
 */
class NodeExecutionError : public WorkflowError {
public:
    NodeExecutionError(
        const std::string& message,
        const std::string& code = "NODE_EXECUTION_ERROR",
        nlohmann::json details = nlohmann::json::object()
    ) : WorkflowError(message), code_(code), details_(std::move(details)) {}

    const std::string& code() const { return code_; }
    const nlohmann::json& details() const { return details_; }

private:
    std::string code_;
    nlohmann::json details_;
};

/**
 * @brief Raised on failures in planning, group dispatch or result aggregation
 */
class OrchestrationError : public WorkflowError {
public:
    explicit OrchestrationError(const std::string& message)
        : WorkflowError(message) {}
};

/**
 * @brief Raised when the execution plan cannot be derived from the graph
 */
class PlanningError : public OrchestrationError {
public:
    explicit PlanningError(const std::string& message)
        : OrchestrationError("Planning failed: " + message) {}
};

/**
 * @brief Raised when an execution observes its cancellation token at a group boundary
 */
class ExecutionCancelled : public OrchestrationError {
public:
    explicit ExecutionCancelled(const std::string& message)
        : OrchestrationError("Execution cancelled: " + message) {}
};

/**
 * @brief Raised when the handler registry or runtime configuration is misused
 */
class ConfigurationError : public WorkflowError {
public:
    explicit ConfigurationError(const std::string& message)
        : WorkflowError("Configuration error: " + message) {}
};

} // namespace dagflow

#endif // DAGFLOW_ERRORS_HPP
