/**
 * @file node_handler.hpp
 * @brief Contract between the engine and externally supplied node handlers
 *
 * A handler turns a NodeExecutionContext into a JSON output. Handlers are
 * selected by node_type through the HandlerRegistry and may be invoked
 * concurrently for different nodes of the same group.
 *
 * Design Principles:
 * - Opaque: the engine never interprets handler configuration or output
 * - Throwing: failures are reported by throwing (NodeExecutionError for a code)
 * - Read-only context: previous outputs are a const view owned by the execution
 */

#ifndef DAGFLOW_NODE_HANDLER_HPP
#define DAGFLOW_NODE_HANDLER_HPP

#include "cancellation.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace dagflow {

/**
 * @brief Node id → output of every node that completed successfully so far
 */
using NodeResultMap = std::map<std::string, nlohmann::json>;

/**
 * @brief Everything a handler may read while executing one node
 */
struct NodeExecutionContext {
    std::string workflow_id;
    std::string execution_id;
    std::string node_id;
    std::string node_type;
    nlohmann::json input;                          ///< Wired upstream outputs, or the workflow input
    nlohmann::json config;                         ///< The node's opaque configuration
    const NodeResultMap* previous_nodes;           ///< Outputs of earlier groups (never null during execution)
    CancellationToken cancellation;                ///< Never cancelled unless the caller supplied a token

    NodeExecutionContext()
        : input(nlohmann::json::object()),
          config(nlohmann::json::object()),
          previous_nodes(nullptr) {}

    /**
     * @brief Output of an earlier node, or nullptr if it has none
     */
    const nlohmann::json* previous_output(const std::string& node_id_) const {
        if (!previous_nodes) {
            return nullptr;
        }
        auto it = previous_nodes->find(node_id_);
        return it != previous_nodes->end() ? &it->second : nullptr;
    }
};

/**
 * @brief Structured description of a failed node
 */
struct NodeError {
    std::string message;
    std::string code;
    nlohmann::json details;

    NodeError() : details(nlohmann::json::object()) {}
    NodeError(const std::string& message_, const std::string& code_,
              nlohmann::json details_ = nlohmann::json::object())
        : message(message_), code(code_), details(std::move(details_)) {}
};

/**
 * @brief Timing and retry information, reported on success and on failure
 */
struct NodeResultMetadata {
    double latency_ms;
    size_t retry_count;

    NodeResultMetadata() : latency_ms(0.0), retry_count(0) {}
};

/**
 * @brief Result of executing a single node
 */
struct NodeExecutionResult {
    bool success;
    nlohmann::json output;            ///< Handler output; null when success == false
    std::optional<NodeError> error;   ///< Set when success == false
    NodeResultMetadata metadata;

    NodeExecutionResult() : success(true) {}

    static NodeExecutionResult succeeded(nlohmann::json output_) {
        NodeExecutionResult result;
        result.success = true;
        result.output = std::move(output_);
        return result;
    }

    static NodeExecutionResult failed(NodeError error_) {
        NodeExecutionResult result;
        result.success = false;
        result.error = std::move(error_);
        return result;
    }
};

/**
 * @brief Abstract interface for node handlers
 *
 * Usage Example:
 *   @code
 *   class UppercaseHandler : public NodeHandler {
 *   public:
 *       nlohmann::json execute(const NodeExecutionContext& ctx) override {
 *           std::string text = ctx.input.value("text", "");
 *           std::transform(text.begin(), text.end(), text.begin(), ::toupper);
 *           return {{"text", text}};
 *       }
 *   };
 *   @endcode
 */
class NodeHandler {
public:
    virtual ~NodeHandler() = default;

    /**
     * @brief Execute a node
     *
     * @param ctx Node execution context
     * @return Handler output, stored under the node's id
     *
     * @throws NodeExecutionError (or any std::exception) on failure
     *
     * @note Must be safe to call concurrently with different contexts
     */
    virtual nlohmann::json execute(const NodeExecutionContext& ctx) = 0;
};

/**
 * @brief Adapts a callable to the NodeHandler interface
 */
class FunctionHandler : public NodeHandler {
public:
    using Function = std::function<nlohmann::json(const NodeExecutionContext&)>;

    explicit FunctionHandler(Function fn) : fn_(std::move(fn)) {}

    nlohmann::json execute(const NodeExecutionContext& ctx) override {
        return fn_(ctx);
    }

private:
    Function fn_;
};

/**
 * @brief Fallback for node types nobody registered
 *
 * Returns a placeholder output instead of failing the node.
 */
class NotImplementedHandler : public NodeHandler {
public:
    nlohmann::json execute(const NodeExecutionContext& ctx) override {
        return {{"output", "Node type " + ctx.node_type + " not implemented yet"}};
    }
};

} // namespace dagflow

#endif // DAGFLOW_NODE_HANDLER_HPP
