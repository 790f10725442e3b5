/**
 * @file node_executor.cpp
 * @brief Implementation of NodeExecutor
 */

#include "node_executor.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include <chrono>
#include <thread>

namespace dagflow {

NodeExecutor::NodeExecutor(
    const HandlerRegistry& registry,
    NodeLogSink* log_sink,
    const RetryPolicy& retry,
    Logger* logger
) : registry_(registry),
    log_sink_(log_sink),
    retry_(retry),
    logger_(logger ? logger : &Logger::get_instance()) {}

nlohmann::json NodeExecutor::assemble_input(
    const workflow::Workflow& workflow,
    const std::string& node_id,
    const nlohmann::json& workflow_input,
    const NodeResultMap& previous_outputs
) {
    nlohmann::json input = nlohmann::json::object();
    bool wired = false;

    for (const auto& edge : workflow.definition.edges) {
        if (edge.target_node_id != node_id) {
            continue;
        }
        auto it = previous_outputs.find(edge.source_node_id);
        if (it == previous_outputs.end()) {
            continue;
        }
        const std::string& key = edge.target_port.empty() ? edge.source_node_id : edge.target_port;
        input[key] = it->second;
        wired = true;
    }

    return wired ? input : workflow_input;
}

NodeExecutionResult NodeExecutor::execute_node(
    const workflow::Workflow& workflow,
    const workflow::WorkflowNode& node,
    const nlohmann::json& workflow_input,
    const NodeResultMap& previous_outputs,
    const NodeExecutionScope& scope,
    std::vector<std::string>* warnings
) const {
    auto start_time = std::chrono::steady_clock::now();

    NodeExecutionContext ctx;
    ctx.workflow_id = workflow.id;
    ctx.execution_id = scope.execution_id;
    ctx.node_id = node.id;
    ctx.node_type = node.node_type;
    ctx.input = assemble_input(workflow, node.id, workflow_input, previous_outputs);
    ctx.config = node.config;
    ctx.previous_nodes = &previous_outputs;
    ctx.cancellation = scope.cancellation;

    std::shared_ptr<NodeHandler> handler = registry_.resolve(node.node_type);

    NodeExecutionResult result = invoke_once(*handler, ctx);
    size_t retries = 0;
    while (!result.success && retries < retry_.max_retries && !scope.cancellation.is_cancelled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(retry_.delay_for_retry(retries)));
        ++retries;
        result = invoke_once(*handler, ctx);
    }

    auto end_time = std::chrono::steady_clock::now();
    result.metadata.latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    result.metadata.retry_count = retries;

    LogContext log_ctx = LogContext(workflow.id, scope.execution_id).for_node(node.id, node.node_type);
    logger_->log_node_complete(log_ctx, result);
    append_log_record(node, scope, result, log_ctx, warnings);

    return result;
}

NodeExecutionResult NodeExecutor::invoke_once(NodeHandler& handler, const NodeExecutionContext& ctx) const {
    try {
        return NodeExecutionResult::succeeded(handler.execute(ctx));
    } catch (const NodeExecutionError& e) {
        return NodeExecutionResult::failed(NodeError(e.what(), e.code(), e.details()));
    } catch (const std::exception& e) {
        return NodeExecutionResult::failed(NodeError(e.what(), "HANDLER_EXCEPTION"));
    }
}

void NodeExecutor::append_log_record(
    const workflow::WorkflowNode& node,
    const NodeExecutionScope& scope,
    const NodeExecutionResult& result,
    const LogContext& log_ctx,
    std::vector<std::string>* warnings
) const {
    if (!log_sink_) {
        return;
    }

    NodeLogRecord record;
    record.execution_id = scope.execution_id;
    record.node_id = node.id;
    record.node_key = node.node_key;
    record.node_type = node.node_type;
    record.status = result.success ? NodeLogStatus::COMPLETED : NodeLogStatus::FAILED;
    record.output_data = result.success ? result.output : nlohmann::json(nullptr);
    record.error_data = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
    record.latency_ms = result.metadata.latency_ms;
    record.completed_at = std::chrono::system_clock::now();

    try {
        log_sink_->append(record);
    } catch (const std::exception& e) {
        std::string warning = "Failed to record node log for " + node.id + ": " + e.what();
        logger_->log_warning(log_ctx, warning);
        if (warnings) {
            warnings->push_back(warning);
        }
    }
}

} // namespace dagflow
