/**
 * @file node_executor.hpp
 * @brief Runs one workflow node: input wiring, dispatch, timing, retry, node log
 *
 * The executor never lets a handler exception escape as long as it derives from
 * std::exception. Such failures become a failed NodeExecutionResult so that
 * sibling nodes in the same group are unaffected.
 */

#ifndef DAGFLOW_NODE_EXECUTOR_HPP
#define DAGFLOW_NODE_EXECUTOR_HPP

#include "cancellation.hpp"
#include "handler_registry.hpp"
#include "logger.hpp"
#include "node_handler.hpp"
#include "stores.hpp"
#include "workflow_model.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Per-node retry behaviour
 *
 * The default performs a single attempt.
 */
struct RetryPolicy {
    size_t max_retries;           ///< Additional attempts after the first failure
    int64_t delay_ms;             ///< Delay before the first retry
    bool exponential_backoff;     ///< Double the delay after every retry

    RetryPolicy()
        : max_retries(0),
          delay_ms(100),
          exponential_backoff(true) {}

    /**
     * @brief Delay before retry number `retry` (0-based)
     */
    int64_t delay_for_retry(size_t retry) const {
        if (!exponential_backoff) {
            return delay_ms;
        }
        return delay_ms * (int64_t(1) << std::min<size_t>(retry, 30));
    }
};

/**
 * @brief Identity of the execution a node runs in
 */
struct NodeExecutionScope {
    std::string execution_id;
    CancellationToken cancellation;

    NodeExecutionScope() = default;
    NodeExecutionScope(const std::string& execution_id_, CancellationToken cancellation_ = CancellationToken())
        : execution_id(execution_id_), cancellation(std::move(cancellation_)) {}
};

/**
 * @brief Executes single nodes against a handler registry
 *
 * Usage Example:
 *   @code
 *   HandlerRegistry registry;
 *   MemoryNodeLogSink sink;
 *   NodeExecutor executor(registry, &sink);
 *
 *   NodeResultMap previous;
 *   NodeExecutionResult result = executor.execute_node(
 *       workflow, *workflow.find_node("trigger"), input, previous, NodeExecutionScope("exec-1"));
 *   @endcode
 */
class NodeExecutor {
public:
    /**
     * @param registry Handler lookup; must outlive the executor
     * @param log_sink Optional destination for node-log records
     * @param retry Retry policy applied to every node
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    NodeExecutor(
        const HandlerRegistry& registry,
        NodeLogSink* log_sink = nullptr,
        const RetryPolicy& retry = RetryPolicy(),
        Logger* logger = nullptr
    );

    /**
     * @brief Run one node
     *
     * Assembles the input (see assemble_input), resolves the handler by node
     * type, invokes it, and appends exactly one record to the node-log sink.
     * Safe to call concurrently for different nodes.
     *
     * @param workflow Workflow that owns the node
     * @param node Node to execute
     * @param workflow_input Execution-level input
     * @param previous_outputs Outputs of nodes from earlier groups
     * @param scope Execution id and cancellation token
     * @param warnings Optional collector for non-fatal node-log sink failures
     *
     * @return Success with output, or failure with message/code/details. Latency
     *         and retry count are always set.
     */
    NodeExecutionResult execute_node(
        const workflow::Workflow& workflow,
        const workflow::WorkflowNode& node,
        const nlohmann::json& workflow_input,
        const NodeResultMap& previous_outputs,
        const NodeExecutionScope& scope,
        std::vector<std::string>* warnings = nullptr
    ) const;

    /**
     * @brief Build a node's input from its incoming edges
     *
     * Each incoming edge whose source has a recorded output places that output
     * under the edge's target port (or the source node id when the port is
     * empty). Later edges win when two edges share a port. When no edge
     * contributed, the workflow input is returned unchanged.
     */
    static nlohmann::json assemble_input(
        const workflow::Workflow& workflow,
        const std::string& node_id,
        const nlohmann::json& workflow_input,
        const NodeResultMap& previous_outputs
    );

    const RetryPolicy& retry_policy() const { return retry_; }

private:
    const HandlerRegistry& registry_;
    NodeLogSink* log_sink_;
    RetryPolicy retry_;
    Logger* logger_;

    NodeExecutionResult invoke_once(NodeHandler& handler, const NodeExecutionContext& ctx) const;
    void append_log_record(
        const workflow::WorkflowNode& node,
        const NodeExecutionScope& scope,
        const NodeExecutionResult& result,
        const LogContext& log_ctx,
        std::vector<std::string>* warnings
    ) const;
};

} // namespace dagflow

#endif // DAGFLOW_NODE_EXECUTOR_HPP
