#include "execution_state.hpp"

namespace dagflow {

ExecutionStatus string_to_status(const std::string& value) {
    if (value == "created") return ExecutionStatus::CREATED;
    if (value == "running") return ExecutionStatus::RUNNING;
    if (value == "completed") return ExecutionStatus::COMPLETED;
    if (value == "failed") return ExecutionStatus::FAILED;
    throw std::invalid_argument("Unknown execution status: " + value);
}

bool is_valid_transition(ExecutionStatus from, ExecutionStatus to) {
    switch (from) {
        case ExecutionStatus::CREATED:
            return to == ExecutionStatus::RUNNING;
        case ExecutionStatus::RUNNING:
            return to == ExecutionStatus::COMPLETED || to == ExecutionStatus::FAILED;
        case ExecutionStatus::COMPLETED:
        case ExecutionStatus::FAILED:
            return false;
    }
    return false;
}

void WorkflowExecution::transition(ExecutionStatus next) {
    if (!is_valid_transition(status, next)) {
        throw InvalidStateTransition(status, next);
    }
    status = next;
    if (dagflow::is_terminal(next)) {
        completed_at = std::chrono::system_clock::now();
    }
}

} // namespace dagflow
