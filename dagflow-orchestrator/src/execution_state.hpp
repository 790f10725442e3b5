/**
 * @file execution_state.hpp
 * @brief Execution record and its status state machine
 *
 * An execution moves strictly forward:
 *
 *   CREATED → RUNNING → COMPLETED
 *                     ↘ FAILED
 *
 * COMPLETED and FAILED are terminal. Any other transition is a programming
 * error and raises InvalidStateTransition.
 */

#ifndef DAGFLOW_EXECUTION_STATE_HPP
#define DAGFLOW_EXECUTION_STATE_HPP

#include "node_handler.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Lifecycle status of a workflow execution
 */
enum class ExecutionStatus {
    CREATED,    ///< Record exists, no node has run
    RUNNING,    ///< Groups are being executed
    COMPLETED,  ///< All groups ran; individual nodes may still have failed
    FAILED      ///< Orchestration fault; error_data is set
};

/**
 * @brief Convert status to its persisted lowercase form
 */
inline std::string status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::CREATED: return "created";
        case ExecutionStatus::RUNNING: return "running";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Parse a persisted status string
 *
 * @throws std::invalid_argument For unknown values
 */
ExecutionStatus string_to_status(const std::string& value);

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED || status == ExecutionStatus::FAILED;
}

/**
 * @brief Raised when code attempts a transition the state machine forbids
 */
class InvalidStateTransition : public std::logic_error {
public:
    InvalidStateTransition(ExecutionStatus from, ExecutionStatus to)
        : std::logic_error("Invalid execution state transition: " +
                           status_to_string(from) + " -> " + status_to_string(to)),
          from_(from), to_(to) {}

    ExecutionStatus from() const { return from_; }
    ExecutionStatus to() const { return to_; }

private:
    ExecutionStatus from_;
    ExecutionStatus to_;
};

bool is_valid_transition(ExecutionStatus from, ExecutionStatus to);

/**
 * @brief Error recorded on a failed execution
 */
struct ExecutionErrorData {
    std::string message;
    std::string stack;    // Error type and the phase that raised it

    ExecutionErrorData() = default;
    ExecutionErrorData(const std::string& message_, const std::string& stack_)
        : message(message_), stack(stack_) {}
};

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief One run of a workflow against specific input
 *
 * result_data maps node id to output for every node that succeeded. Failed
 * nodes appear only in failed_nodes and node_results.
 */
struct WorkflowExecution {
    std::string id;
    std::string workflow_id;
    ExecutionStatus status;
    std::string triggered_by;
    nlohmann::json input_data;
    nlohmann::json result_data;                         // null until completed
    std::optional<ExecutionErrorData> error_data;
    Timestamp started_at;
    std::optional<Timestamp> completed_at;

    bool has_node_failures;
    std::vector<std::string> failed_nodes;              // Plan order
    std::map<std::string, NodeExecutionResult> node_results;
    std::vector<std::string> warnings;                  // Non-fatal persistence problems

    WorkflowExecution()
        : status(ExecutionStatus::CREATED),
          input_data(nlohmann::json::object()),
          has_node_failures(false) {}

    bool is_terminal() const { return dagflow::is_terminal(status); }

    /**
     * @brief Move to a new status
     *
     * Sets completed_at when the new status is terminal.
     *
     * @throws InvalidStateTransition If the state machine forbids the move
     */
    void transition(ExecutionStatus next);
};

} // namespace dagflow

#endif // DAGFLOW_EXECUTION_STATE_HPP
