#ifndef DAGFLOW_DAG_VALIDATOR_HPP
#define DAGFLOW_DAG_VALIDATOR_HPP

#include "workflow_model.hpp"
#include <string>
#include <vector>

namespace dagflow {
namespace workflow {

/**
 * @brief Outcome of validating a workflow graph
 *
 * Errors make the workflow unexecutable; warnings (unreachable nodes) do not.
 */
struct DAGValidationResult {
    bool valid;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::vector<std::string>> cycles;   // One path per DFS root that hit a cycle
    std::vector<std::string> unreachable_nodes;     // Only computed when trigger nodes exist

    DAGValidationResult() : valid(true) {}

    bool has_cycles() const { return !cycles.empty(); }
};

/**
 * @brief Validates a workflow graph before execution
 *
 * Validates:
 * - At least one node exists
 * - Node ids are non-empty and unique, node types are non-empty
 * - Every edge references existing nodes
 * - No cycles (depth-first search with recursion stack)
 *
 * Reports as warnings:
 * - Nodes not reachable from any "trigger" node
 *
 * @param workflow The workflow to validate
 * @return Validation result; never throws for malformed graphs
 */
DAGValidationResult validate_workflow(const Workflow& workflow);

/**
 * @brief Finds cycles in the directed graph
 *
 * Roots are visited in node order and neighbours in edge order. The search
 * from a root stops at the first cycle it finds, which is reported as the
 * path slice starting at the revisited node. Edges with unknown endpoints
 * are ignored.
 *
 * @param definition Graph nodes and edges
 * @return Cycle paths, empty when the graph is acyclic
 */
std::vector<std::vector<std::string>> detect_cycles(const WorkflowDefinition& definition);

/**
 * @brief Computes nodes that no trigger node can reach
 *
 * @param definition Graph nodes and edges
 * @return Unreachable node ids in node order; empty when there are no trigger nodes
 */
std::vector<std::string> find_unreachable_nodes(const WorkflowDefinition& definition);

} // namespace workflow
} // namespace dagflow

#endif // DAGFLOW_DAG_VALIDATOR_HPP
