#include "dag_validator.hpp"
#include <algorithm>
#include <map>
#include <queue>
#include <set>
#include <sstream>

namespace dagflow {
namespace workflow {

namespace {

using Adjacency = std::map<std::string, std::vector<std::string>>;

Adjacency build_adjacency(const WorkflowDefinition& definition) {
    Adjacency graph;
    for (const auto& node : definition.nodes) {
        graph.emplace(node.id, std::vector<std::string>());
    }
    for (const auto& edge : definition.edges) {
        auto source_it = graph.find(edge.source_node_id);
        if (source_it == graph.end() || graph.count(edge.target_node_id) == 0) {
            continue;  // Dangling edges are reported as structural errors
        }
        source_it->second.push_back(edge.target_node_id);
    }
    return graph;
}

/**
 * Depth-first cycle search keeping the recursion stack and the current path.
 */
class CycleSearch {
public:
    explicit CycleSearch(const Adjacency& graph) : graph_(graph) {}

    void run_from(const std::string& root, std::vector<std::vector<std::string>>& cycles) {
        path_.clear();
        on_stack_.clear();
        if (visit(root)) {
            cycles.push_back(found_);
        }
    }

    bool visited(const std::string& node_id) const {
        return visited_.count(node_id) > 0;
    }

private:
    const Adjacency& graph_;
    std::set<std::string> visited_;
    std::set<std::string> on_stack_;
    std::vector<std::string> path_;
    std::vector<std::string> found_;

    bool visit(const std::string& node_id) {
        visited_.insert(node_id);
        on_stack_.insert(node_id);
        path_.push_back(node_id);

        auto it = graph_.find(node_id);
        if (it != graph_.end()) {
            for (const std::string& neighbor : it->second) {
                if (!visited(neighbor)) {
                    if (visit(neighbor)) {
                        return true;
                    }
                } else if (on_stack_.count(neighbor) > 0) {
                    auto cycle_start = std::find(path_.begin(), path_.end(), neighbor);
                    found_.assign(cycle_start, path_.end());
                    return true;
                }
            }
        }

        path_.pop_back();
        on_stack_.erase(node_id);
        return false;
    }
};

std::string format_cycle(const std::vector<std::string>& cycle) {
    std::ostringstream oss;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << cycle[i];
    }
    return oss.str();
}

void check_structure(const WorkflowDefinition& definition, DAGValidationResult& result) {
    std::set<std::string> node_ids;
    for (const auto& node : definition.nodes) {
        if (node.id.empty()) {
            result.errors.push_back("Node id cannot be empty");
            continue;
        }
        if (!node_ids.insert(node.id).second) {
            result.errors.push_back("Duplicate node id: " + node.id);
        }
        if (node.node_type.empty()) {
            result.errors.push_back("Node type cannot be empty for node: " + node.id);
        }
    }

    for (const auto& edge : definition.edges) {
        if (node_ids.count(edge.source_node_id) == 0) {
            result.errors.push_back("Edge references unknown source node: " + edge.source_node_id);
        }
        if (node_ids.count(edge.target_node_id) == 0) {
            result.errors.push_back("Edge references unknown target node: " + edge.target_node_id);
        }
    }
}

} // namespace

DAGValidationResult validate_workflow(const Workflow& workflow) {
    DAGValidationResult result;
    const WorkflowDefinition& definition = workflow.definition;

    if (definition.nodes.empty()) {
        result.errors.push_back("Workflow must have at least one node");
    }

    check_structure(definition, result);

    result.cycles = detect_cycles(definition);
    if (!result.cycles.empty()) {
        std::ostringstream oss;
        oss << "Workflow contains cycles: ";
        for (size_t i = 0; i < result.cycles.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << format_cycle(result.cycles[i]);
        }
        result.errors.push_back(oss.str());
    }

    result.unreachable_nodes = find_unreachable_nodes(definition);
    if (!result.unreachable_nodes.empty()) {
        result.warnings.push_back(
            "Found " + std::to_string(result.unreachable_nodes.size()) + " unreachable nodes"
        );
    }

    result.valid = result.errors.empty();
    return result;
}

std::vector<std::vector<std::string>> detect_cycles(const WorkflowDefinition& definition) {
    std::vector<std::vector<std::string>> cycles;
    Adjacency graph = build_adjacency(definition);
    CycleSearch search(graph);

    // Roots in declaration order so reported paths are stable
    for (const auto& node : definition.nodes) {
        if (!search.visited(node.id)) {
            search.run_from(node.id, cycles);
        }
    }

    return cycles;
}

std::vector<std::string> find_unreachable_nodes(const WorkflowDefinition& definition) {
    std::queue<std::string> queue;
    for (const auto& node : definition.nodes) {
        if (node.is_trigger()) {
            queue.push(node.id);
        }
    }

    if (queue.empty()) {
        return {};
    }

    Adjacency graph = build_adjacency(definition);
    std::set<std::string> reachable;

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop();
        if (!reachable.insert(current).second) {
            continue;
        }

        auto it = graph.find(current);
        if (it == graph.end()) {
            continue;
        }
        for (const std::string& target : it->second) {
            if (reachable.count(target) == 0) {
                queue.push(target);
            }
        }
    }

    std::vector<std::string> unreachable;
    for (const auto& node : definition.nodes) {
        if (reachable.count(node.id) == 0) {
            unreachable.push_back(node.id);
        }
    }
    return unreachable;
}

} // namespace workflow
} // namespace dagflow
