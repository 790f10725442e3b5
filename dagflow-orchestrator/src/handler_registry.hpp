/**
 * @file handler_registry.hpp
 * @brief Registry mapping node types to node handlers
 *
 * Design Pattern: Registry with explicit fallback
 * - Callers register one handler per node_type
 * - The node executor resolves handlers by node_type at dispatch time
 * - Unregistered types resolve to NotImplementedHandler instead of failing
 */

#ifndef DAGFLOW_HANDLER_REGISTRY_HPP
#define DAGFLOW_HANDLER_REGISTRY_HPP

#include "node_handler.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Thread-safe node_type → handler mapping
 *
 * Usage Example:
 *   @code
 *   HandlerRegistry registry;
 *   registry.register_handler("trigger_manual", [](const NodeExecutionContext& ctx) {
 *       return ctx.input;
 *   });
 *   auto handler = registry.resolve("trigger_manual");
 *   @endcode
 */
class HandlerRegistry {
public:
    HandlerRegistry();

    /**
     * @brief Register a handler for a node type
     *
     * @param node_type Dispatch key (must be non-empty and not yet registered)
     * @param handler Handler instance, shared by every node of that type
     *
     * @throws ConfigurationError If node_type is empty, handler is null or already registered
     */
    void register_handler(const std::string& node_type, std::shared_ptr<NodeHandler> handler);

    /**
     * @brief Register a callable as the handler for a node type
     *
     * @throws ConfigurationError If node_type is empty or already registered
     */
    void register_handler(const std::string& node_type, FunctionHandler::Function fn);

    /**
     * @brief Register or overwrite the handler for a node type
     *
     * @throws ConfigurationError If node_type is empty or handler is null
     */
    void replace_handler(const std::string& node_type, std::shared_ptr<NodeHandler> handler);

    /**
     * @brief Remove a handler; later resolutions fall back to NotImplementedHandler
     *
     * @return true if a handler was removed
     */
    bool unregister_handler(const std::string& node_type);

    /**
     * @brief Look up the handler for a node type
     *
     * @param node_type Dispatch key
     * @return The registered handler, or the shared NotImplementedHandler
     */
    std::shared_ptr<NodeHandler> resolve(const std::string& node_type) const;

    bool is_registered(const std::string& node_type) const;

    std::vector<std::string> list_node_types() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<NodeHandler>> registry_;
    std::shared_ptr<NodeHandler> not_implemented_;
};

} // namespace dagflow

#endif // DAGFLOW_HANDLER_REGISTRY_HPP
