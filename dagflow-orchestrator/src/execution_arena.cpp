#include "execution_arena.hpp"
#include "errors.hpp"

namespace dagflow {

void ExecutionArena::record(const std::string& node_id, NodeExecutionResult result) {
    if (results_.count(node_id) > 0) {
        throw OrchestrationError("Result for node " + node_id + " recorded twice");
    }

    if (result.success) {
        outputs_[node_id] = result.output;
    } else {
        failed_nodes_.push_back(node_id);
    }
    results_.emplace(node_id, std::move(result));
}

nlohmann::json ExecutionArena::outputs_as_json() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [node_id, output] : outputs_) {
        result[node_id] = output;
    }
    return result;
}

} // namespace dagflow
