#ifndef DAGFLOW_EXECUTION_PLAN_HPP
#define DAGFLOW_EXECUTION_PLAN_HPP

#include "workflow_model.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dagflow {
namespace workflow {

/**
 * @brief Per-step duration estimate in milliseconds
 *
 * Fixed placeholder; informational only and never used for scheduling.
 */
constexpr int64_t PLACEHOLDER_STEP_DURATION_MS = 1000;

/**
 * @brief One node's entry in the flat step list
 */
struct ExecutionStep {
    std::string node_id;
    std::vector<std::string> dependencies;   // Direct predecessors, edge order, no duplicates
    bool can_run_in_parallel;                // True when its group has more than one member
    int64_t estimated_duration_ms;

    ExecutionStep() : can_run_in_parallel(false), estimated_duration_ms(PLACEHOLDER_STEP_DURATION_MS) {}
};

/**
 * @brief Level-stratified topological order of a workflow
 *
 * parallel_groups[k] contains nodes whose predecessors all lie in groups < k,
 * so members of one group may execute concurrently.
 */
struct ExecutionPlan {
    std::vector<ExecutionStep> steps;
    std::vector<std::vector<std::string>> parallel_groups;
    int64_t estimated_duration_ms;

    ExecutionPlan() : estimated_duration_ms(0) {}

    size_t node_count() const { return steps.size(); }

    const ExecutionStep* find_step(const std::string& node_id) const {
        for (const auto& step : steps) {
            if (step.node_id == node_id) {
                return &step;
            }
        }
        return nullptr;
    }
};

/**
 * @brief Builds the execution plan with Kahn's algorithm by waves
 *
 * Group 0 holds the in-degree-0 nodes in node order. Each following group holds
 * the successors (in edge order) whose in-degree drops to zero once the previous
 * group is removed.
 *
 * The workflow is expected to have passed validate_workflow(); cycles are not
 * searched for here.
 *
 * @param workflow A validated workflow
 * @return The execution plan; identical input always yields an identical plan
 * @throws PlanningError if an edge references an unknown node or the waves do not
 *         cover every node exactly once
 */
ExecutionPlan build_execution_plan(const Workflow& workflow);

} // namespace workflow
} // namespace dagflow

#endif // DAGFLOW_EXECUTION_PLAN_HPP
