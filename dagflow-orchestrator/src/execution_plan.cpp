#include "execution_plan.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace dagflow {
namespace workflow {

ExecutionPlan build_execution_plan(const Workflow& workflow) {
    const auto& nodes = workflow.definition.nodes;
    const auto& edges = workflow.definition.edges;

    std::map<std::string, int> in_degree;
    std::map<std::string, std::vector<std::string>> dependencies;

    for (const auto& node : nodes) {
        in_degree[node.id] = 0;
        dependencies[node.id] = {};
    }

    for (const auto& edge : edges) {
        if (in_degree.count(edge.source_node_id) == 0) {
            throw PlanningError("edge references unknown source node: " + edge.source_node_id);
        }
        if (in_degree.count(edge.target_node_id) == 0) {
            throw PlanningError("edge references unknown target node: " + edge.target_node_id);
        }

        in_degree[edge.target_node_id]++;

        auto& deps = dependencies[edge.target_node_id];
        if (std::find(deps.begin(), deps.end(), edge.source_node_id) == deps.end()) {
            deps.push_back(edge.source_node_id);
        }
    }

    ExecutionPlan plan;
    std::vector<std::string> current_level;
    for (const auto& node : nodes) {
        if (in_degree[node.id] == 0) {
            current_level.push_back(node.id);
        }
    }

    while (!current_level.empty()) {
        plan.parallel_groups.push_back(current_level);

        for (const std::string& node_id : current_level) {
            ExecutionStep step;
            step.node_id = node_id;
            step.dependencies = dependencies[node_id];
            step.can_run_in_parallel = current_level.size() > 1;
            step.estimated_duration_ms = PLACEHOLDER_STEP_DURATION_MS;
            plan.estimated_duration_ms += step.estimated_duration_ms;
            plan.steps.push_back(std::move(step));
        }

        // Successors are released in edge order, not member order
        std::set<std::string> members(current_level.begin(), current_level.end());
        std::vector<std::string> next_level;
        std::set<std::string> queued;
        for (const auto& edge : edges) {
            if (members.count(edge.source_node_id) == 0) {
                continue;
            }
            if (--in_degree[edge.target_node_id] == 0 && queued.insert(edge.target_node_id).second) {
                next_level.push_back(edge.target_node_id);
            }
        }

        current_level = std::move(next_level);
    }

    // Kahn's algorithm leaves nodes on a cycle (or behind one) unscheduled
    if (plan.steps.size() != nodes.size()) {
        std::set<std::string> scheduled;
        for (const auto& step : plan.steps) {
            scheduled.insert(step.node_id);
        }

        std::ostringstream oss;
        oss << (nodes.size() - plan.steps.size()) << " node(s) could not be scheduled:";
        for (const auto& node : nodes) {
            if (scheduled.count(node.id) == 0) {
                oss << " " << node.id;
            }
        }
        throw PlanningError(oss.str());
    }

    return plan;
}

} // namespace workflow
} // namespace dagflow
