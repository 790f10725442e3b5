#ifndef DAGFLOW_WORKFLOW_MODEL_HPP
#define DAGFLOW_WORKFLOW_MODEL_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dagflow {
namespace workflow {

/**
 * @brief Well-known node categories
 */
namespace NodeCategory {
    constexpr const char* TRIGGER = "trigger";
    constexpr const char* DATA = "data";
    constexpr const char* TRANSFORM = "transform";
    constexpr const char* ACTION = "action";
    constexpr const char* CONTROL = "control";
    constexpr const char* OUTPUT = "output";
}

/**
 * @brief A unit of work in the workflow graph
 */
struct WorkflowNode {
    std::string id;               // Unique within the workflow
    std::string node_key;         // Optional human-readable key, copied into node logs
    std::string node_type;        // Handler dispatch key, e.g. "trigger_manual"
    std::string category;         // "trigger" marks DAG roots
    nlohmann::json config;        // Opaque handler configuration

    WorkflowNode() : config(nlohmann::json::object()) {}
    WorkflowNode(const std::string& id_, const std::string& node_type_, const std::string& category_ = "")
        : id(id_), node_type(node_type_), category(category_), config(nlohmann::json::object()) {}

    bool is_trigger() const { return category == NodeCategory::TRIGGER; }
};

/**
 * @brief Directed wiring from an upstream output port to a downstream input port
 */
struct WorkflowEdge {
    std::string source_node_id;
    std::string target_node_id;
    std::string source_port;
    std::string target_port;      // Input key the upstream output is placed under

    WorkflowEdge() = default;
    WorkflowEdge(const std::string& source_, const std::string& target_,
                 const std::string& source_port_ = "output", const std::string& target_port_ = "input")
        : source_node_id(source_), target_node_id(target_),
          source_port(source_port_), target_port(target_port_) {}
};

/**
 * @brief Nodes and edges in declaration order
 */
struct WorkflowDefinition {
    std::vector<WorkflowNode> nodes;
    std::vector<WorkflowEdge> edges;
};

/**
 * @brief A workflow as stored by the workflow store; read-only to the engine
 */
struct Workflow {
    std::string id;
    std::string name;
    WorkflowDefinition definition;

    Workflow() = default;
    explicit Workflow(const std::string& id_) : id(id_) {}

    const WorkflowNode* find_node(const std::string& node_id) const {
        for (const auto& node : definition.nodes) {
            if (node.id == node_id) {
                return &node;
            }
        }
        return nullptr;
    }
};

} // namespace workflow
} // namespace dagflow

#endif // DAGFLOW_WORKFLOW_MODEL_HPP
