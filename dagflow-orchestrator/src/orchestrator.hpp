/**
 * @file orchestrator.hpp
 * @brief Drives a workflow execution from load to persisted terminal record
 *
 * The ExecutionOrchestrator is responsible for:
 * - Loading the workflow and rejecting invalid graphs before any record exists
 * - Building the execution plan
 * - Running each parallel group with a fan-out/join barrier
 * - Aggregating node outputs into result_data
 * - Persisting the execution record and emitting lifecycle events
 *
 * Failure handling:
 * - Node failures are absorbed by default (FailurePolicy::BEST_EFFORT) and
 *   surface through has_node_failures / failed_nodes
 * - Orchestration faults (planning, dispatch, aggregation, cancellation, or a
 *   failed node under FailurePolicy::FAIL_FAST) mark the execution failed and
 *   are re-thrown
 */

#ifndef DAGFLOW_ORCHESTRATOR_HPP
#define DAGFLOW_ORCHESTRATOR_HPP

#include "cancellation.hpp"
#include "dag_validator.hpp"
#include "event_bus.hpp"
#include "execution_arena.hpp"
#include "execution_plan.hpp"
#include "execution_state.hpp"
#include "handler_registry.hpp"
#include "logger.hpp"
#include "node_executor.hpp"
#include "stores.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief What a failed node does to the execution
 */
enum class FailurePolicy {
    BEST_EFFORT,   ///< Keep running; the execution completes with has_node_failures set
    FAIL_FAST      ///< Fail the execution once the group containing the failed node has joined
};

inline std::string failure_policy_to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::BEST_EFFORT: return "best_effort";
        case FailurePolicy::FAIL_FAST: return "fail_fast";
        default: return "unknown";
    }
}

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    FailurePolicy failure_policy;
    RetryPolicy retry;

    OrchestratorConfig() : failure_policy(FailurePolicy::BEST_EFFORT) {}
};

/**
 * @brief Executes workflows against the configured collaborators
 *
 * Each call to execute_workflow() is independent and owns its own result
 * arena. Collaborators must outlive the orchestrator.
 *
 * Usage Example:
 *   @code
 *   MemoryWorkflowStore workflows;
 *   MemoryExecutionStore executions;
 *   HandlerRegistry handlers;
 *   EventBus events;
 *   MemoryNodeLogSink node_logs;
 *
 *   handlers.register_handler("trigger_manual", [](const NodeExecutionContext& ctx) {
 *       return ctx.input;
 *   });
 *
 *   ExecutionOrchestrator orchestrator(workflows, executions, handlers, &events, &node_logs);
 *   WorkflowExecution execution = orchestrator.execute_workflow("wf-1", {{"x", 1}}, "user-42");
 *
 *   if (execution.has_node_failures) {
 *       for (const auto& node_id : execution.failed_nodes) {
 *           std::cerr << node_id << ": " << execution.node_results[node_id].error->message << std::endl;
 *       }
 *   }
 *   @endcode
 */
class ExecutionOrchestrator {
public:
    /**
     * @param workflows Workflow source
     * @param executions Execution record store
     * @param handlers Node handler registry
     * @param events Optional lifecycle event bus
     * @param node_logs Optional node-log sink
     * @param config Failure and retry policy
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    ExecutionOrchestrator(
        const WorkflowStore& workflows,
        ExecutionStore& executions,
        const HandlerRegistry& handlers,
        EventBus* events = nullptr,
        NodeLogSink* node_logs = nullptr,
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Run a workflow end to end
     *
     * @param workflow_id Workflow to load
     * @param input_data Execution input, used by nodes without wired inputs
     * @param triggered_by Recorded on the execution and in the started event
     * @param cancellation Checked before every group
     *
     * @return The completed execution record
     *
     * @throws NotFoundError If the workflow does not exist (no record is created)
     * @throws ValidationError If the workflow is invalid (no record is created)
     * @throws PersistenceError If the workflow cannot be read or the record cannot be created
     * @throws OrchestrationError After marking the execution failed
     */
    WorkflowExecution execute_workflow(
        const std::string& workflow_id,
        const nlohmann::json& input_data,
        const std::string& triggered_by,
        CancellationToken cancellation = CancellationToken()
    );

    workflow::DAGValidationResult validate(const workflow::Workflow& workflow) const;

    /**
     * @throws PlanningError If the graph cannot be stratified
     */
    workflow::ExecutionPlan plan(const workflow::Workflow& workflow) const;

    const OrchestratorConfig& config() const { return config_; }

private:
    const WorkflowStore& workflows_;
    ExecutionStore& executions_;
    EventBus* events_;
    OrchestratorConfig config_;
    Logger* logger_;
    NodeExecutor executor_;

    void run_group(
        const workflow::Workflow& workflow,
        const std::vector<std::string>& group,
        const nlohmann::json& input_data,
        const NodeExecutionScope& scope,
        ExecutionArena& arena,
        std::vector<std::string>& warnings
    ) const;

    void transition(WorkflowExecution& execution, ExecutionStatus next, const LogContext& ctx) const;
    void persist_update(WorkflowExecution& execution, const LogContext& ctx) const;
    void fail_execution(WorkflowExecution& execution, const std::string& message,
                        const std::string& stack, const LogContext& ctx) const;
    void emit(const std::string& event, const nlohmann::json& payload) const;
};

} // namespace dagflow

#endif // DAGFLOW_ORCHESTRATOR_HPP
