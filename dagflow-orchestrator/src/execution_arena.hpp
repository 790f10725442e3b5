#ifndef DAGFLOW_EXECUTION_ARENA_HPP
#define DAGFLOW_EXECUTION_ARENA_HPP

#include "node_handler.hpp"
#include <map>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Per-execution result store
 *
 * Each node id is recorded at most once. outputs() exposes only successful
 * outputs and is what running nodes see as previous_nodes; the orchestrator
 * writes to the arena only between groups, never while one is running.
 */
class ExecutionArena {
public:
    /**
     * @brief Record the result of a node
     *
     * @throws OrchestrationError If the node already has a result
     */
    void record(const std::string& node_id, NodeExecutionResult result);

    bool contains(const std::string& node_id) const { return results_.count(node_id) > 0; }

    const NodeResultMap& outputs() const { return outputs_; }

    const std::map<std::string, NodeExecutionResult>& results() const { return results_; }

    /// Failed node ids in the order they were recorded
    const std::vector<std::string>& failed_nodes() const { return failed_nodes_; }

    size_t size() const { return results_.size(); }

    /**
     * @brief Successful outputs as a JSON object keyed by node id
     */
    nlohmann::json outputs_as_json() const;

private:
    NodeResultMap outputs_;
    std::map<std::string, NodeExecutionResult> results_;
    std::vector<std::string> failed_nodes_;
};

} // namespace dagflow

#endif // DAGFLOW_EXECUTION_ARENA_HPP
