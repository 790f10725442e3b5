/**
 * @file orchestrator.cpp
 * @brief Implementation of ExecutionOrchestrator
 */

#include "orchestrator.hpp"
#include "errors.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <optional>

namespace dagflow {

namespace {

std::string error_type_name(const std::exception& e) {
    if (dynamic_cast<const ExecutionCancelled*>(&e)) return "ExecutionCancelled";
    if (dynamic_cast<const PlanningError*>(&e)) return "PlanningError";
    if (dynamic_cast<const OrchestrationError*>(&e)) return "OrchestrationError";
    if (dynamic_cast<const PersistenceError*>(&e)) return "PersistenceError";
    if (dynamic_cast<const WorkflowError*>(&e)) return "WorkflowError";
    if (dynamic_cast<const std::logic_error*>(&e)) return "std::logic_error";
    return "std::exception";
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

ExecutionOrchestrator::ExecutionOrchestrator(
    const WorkflowStore& workflows,
    ExecutionStore& executions,
    const HandlerRegistry& handlers,
    EventBus* events,
    NodeLogSink* node_logs,
    const OrchestratorConfig& config,
    Logger* logger
) : workflows_(workflows),
    executions_(executions),
    events_(events),
    config_(config),
    logger_(logger ? logger : &Logger::get_instance()),
    executor_(handlers, node_logs, config.retry, logger_) {}

workflow::DAGValidationResult ExecutionOrchestrator::validate(const workflow::Workflow& workflow) const {
    return workflow::validate_workflow(workflow);
}

workflow::ExecutionPlan ExecutionOrchestrator::plan(const workflow::Workflow& workflow) const {
    return workflow::build_execution_plan(workflow);
}

WorkflowExecution ExecutionOrchestrator::execute_workflow(
    const std::string& workflow_id,
    const nlohmann::json& input_data,
    const std::string& triggered_by,
    CancellationToken cancellation
) {
    auto start_time = std::chrono::steady_clock::now();
    LogContext ctx(workflow_id, "");

    // Load and validate; nothing is persisted if either fails
    std::optional<workflow::Workflow> loaded = workflows_.find(workflow_id);
    if (!loaded) {
        logger_->log_error(ctx.in_phase("load"), "Workflow not found: " + workflow_id);
        throw NotFoundError("Workflow not found: " + workflow_id);
    }
    const workflow::Workflow& wf = *loaded;

    workflow::DAGValidationResult validation = validate(wf);
    if (!validation.valid) {
        ValidationError error(validation.errors);
        logger_->log_error(ctx.in_phase("validate"), error.what(), "ValidationError");
        throw error;
    }
    logger_->log_validation_warnings(ctx.in_phase("validate"), validation.warnings);

    WorkflowExecution draft;
    draft.workflow_id = workflow_id;
    draft.triggered_by = triggered_by;
    draft.input_data = input_data;
    draft.started_at = std::chrono::system_clock::now();
    transition(draft, ExecutionStatus::RUNNING, ctx);

    WorkflowExecution execution = executions_.create(draft);
    ctx.execution_id = execution.id;

    logger_->log_execution_start(ctx, triggered_by, wf.definition.nodes.size());
    emit(LifecycleEvent::STARTED, {
        {"workflowId", workflow_id},
        {"executionId", execution.id},
        {"triggeredBy", triggered_by}
    });

    ExecutionArena arena;
    std::string phase = "plan";
    try {
        workflow::ExecutionPlan execution_plan = plan(wf);
        logger_->log_plan_built(ctx.in_phase("plan"), execution_plan);

        NodeExecutionScope scope(execution.id, cancellation);
        const auto& groups = execution_plan.parallel_groups;

        for (size_t g = 0; g < groups.size(); ++g) {
            phase = "group " + std::to_string(g);

            if (cancellation.is_cancelled()) {
                throw ExecutionCancelled("before group " + std::to_string(g) + " of " +
                                         std::to_string(groups.size()));
            }

            auto group_start = std::chrono::steady_clock::now();
            logger_->log_group_start(ctx.in_phase("execute"), g, groups[g].size());

            size_t failed_before = arena.failed_nodes().size();
            run_group(wf, groups[g], input_data, scope, arena, execution.warnings);
            size_t failed_in_group = arena.failed_nodes().size() - failed_before;

            logger_->log_group_complete(ctx.in_phase("execute"), g, failed_in_group, elapsed_ms(group_start));

            if (failed_in_group > 0 && config_.failure_policy == FailurePolicy::FAIL_FAST) {
                const std::string& node_id = arena.failed_nodes()[failed_before];
                const NodeExecutionResult& failed = arena.results().at(node_id);
                throw OrchestrationError("Node " + node_id + " failed: " +
                                         (failed.error ? failed.error->message : std::string("unknown error")));
            }
        }

        phase = "aggregate";
        if (arena.size() != wf.definition.nodes.size()) {
            throw OrchestrationError(std::to_string(arena.size()) + " of " +
                                     std::to_string(wf.definition.nodes.size()) + " nodes produced a result");
        }

        execution.result_data = arena.outputs_as_json();
        execution.node_results = arena.results();
        for (const auto& group : groups) {
            for (const auto& node_id : group) {
                if (!arena.results().at(node_id).success) {
                    execution.failed_nodes.push_back(node_id);
                }
            }
        }
        execution.has_node_failures = !execution.failed_nodes.empty();
    } catch (const std::exception& e) {
        execution.node_results = arena.results();
        execution.failed_nodes = arena.failed_nodes();
        execution.has_node_failures = !execution.failed_nodes.empty();
        fail_execution(execution, e.what(), error_type_name(e) + " during " + phase, ctx);
        throw;
    } catch (...) {
        fail_execution(execution, "Unknown error", "non-standard exception during " + phase, ctx);
        throw;
    }

    transition(execution, ExecutionStatus::COMPLETED, ctx);
    persist_update(execution, ctx);

    logger_->log_execution_complete(ctx, execution, elapsed_ms(start_time));
    emit(LifecycleEvent::COMPLETED, {
        {"workflowId", workflow_id},
        {"executionId", execution.id},
        {"result", execution.result_data}
    });

    return execution;
}

void ExecutionOrchestrator::run_group(
    const workflow::Workflow& workflow,
    const std::vector<std::string>& group,
    const nlohmann::json& input_data,
    const NodeExecutionScope& scope,
    ExecutionArena& arena,
    std::vector<std::string>& warnings
) const {
    std::vector<const workflow::WorkflowNode*> nodes;
    nodes.reserve(group.size());
    for (const auto& node_id : group) {
        const workflow::WorkflowNode* node = workflow.find_node(node_id);
        if (!node) {
            throw OrchestrationError("Plan references unknown node: " + node_id);
        }
        nodes.push_back(node);
    }

    // Read-only for the lifetime of the group
    const NodeResultMap& previous = arena.outputs();
    std::vector<std::vector<std::string>> node_warnings(nodes.size());
    std::vector<std::future<NodeExecutionResult>> futures;
    futures.reserve(nodes.size());

    for (size_t i = 0; i < nodes.size(); ++i) {
        const workflow::WorkflowNode* node = nodes[i];
        std::vector<std::string>* collector = &node_warnings[i];
        futures.push_back(std::async(std::launch::async, [this, &workflow, node, &input_data, &previous, &scope, collector]() {
            return executor_.execute_node(workflow, *node, input_data, previous, scope, collector);
        }));
    }

    // Join every member before surfacing a dispatch failure
    std::vector<NodeExecutionResult> results(nodes.size());
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results[i] = futures[i].get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        arena.record(nodes[i]->id, std::move(results[i]));
        warnings.insert(warnings.end(), node_warnings[i].begin(), node_warnings[i].end());
    }
}

void ExecutionOrchestrator::transition(WorkflowExecution& execution, ExecutionStatus next, const LogContext& ctx) const {
    ExecutionStatus previous = execution.status;
    execution.transition(next);
    logger_->log_state_transition(ctx, previous, next);
}

void ExecutionOrchestrator::persist_update(WorkflowExecution& execution, const LogContext& ctx) const {
    try {
        executions_.update(execution);
    } catch (const std::exception& e) {
        std::string warning = std::string("Failed to update execution record: ") + e.what();
        logger_->log_warning(ctx.in_phase("persist"), warning);
        execution.warnings.push_back(warning);
    }
}

void ExecutionOrchestrator::fail_execution(
    WorkflowExecution& execution,
    const std::string& message,
    const std::string& stack,
    const LogContext& ctx
) const {
    execution.error_data = ExecutionErrorData(message, stack);
    transition(execution, ExecutionStatus::FAILED, ctx);
    persist_update(execution, ctx);

    logger_->log_execution_failed(ctx, message, stack);
    emit(LifecycleEvent::FAILED, {
        {"workflowId", execution.workflow_id},
        {"executionId", execution.id},
        {"error", message}
    });
}

void ExecutionOrchestrator::emit(const std::string& event, const nlohmann::json& payload) const {
    if (events_) {
        events_->emit(event, payload);
    }
}

} // namespace dagflow
