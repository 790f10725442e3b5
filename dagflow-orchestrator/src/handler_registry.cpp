/**
 * @file handler_registry.cpp
 * @brief Implementation of HandlerRegistry
 */

#include "handler_registry.hpp"
#include "errors.hpp"

namespace dagflow {

HandlerRegistry::HandlerRegistry()
    : not_implemented_(std::make_shared<NotImplementedHandler>()) {}

void HandlerRegistry::register_handler(const std::string& node_type, std::shared_ptr<NodeHandler> handler) {
    if (node_type.empty()) {
        throw ConfigurationError("Node type cannot be empty");
    }
    if (!handler) {
        throw ConfigurationError("Handler for node type " + node_type + " cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.find(node_type) != registry_.end()) {
        throw ConfigurationError("Node type already registered: " + node_type);
    }
    registry_[node_type] = std::move(handler);
}

void HandlerRegistry::register_handler(const std::string& node_type, FunctionHandler::Function fn) {
    if (!fn) {
        throw ConfigurationError("Handler function for node type " + node_type + " cannot be empty");
    }
    register_handler(node_type, std::make_shared<FunctionHandler>(std::move(fn)));
}

void HandlerRegistry::replace_handler(const std::string& node_type, std::shared_ptr<NodeHandler> handler) {
    if (node_type.empty()) {
        throw ConfigurationError("Node type cannot be empty");
    }
    if (!handler) {
        throw ConfigurationError("Handler for node type " + node_type + " cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    registry_[node_type] = std::move(handler);
}

bool HandlerRegistry::unregister_handler(const std::string& node_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.erase(node_type) > 0;
}

std::shared_ptr<NodeHandler> HandlerRegistry::resolve(const std::string& node_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(node_type);
    if (it == registry_.end()) {
        return not_implemented_;
    }
    return it->second;
}

bool HandlerRegistry::is_registered(const std::string& node_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(node_type) != registry_.end();
}

std::vector<std::string> HandlerRegistry::list_node_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

} // namespace dagflow
