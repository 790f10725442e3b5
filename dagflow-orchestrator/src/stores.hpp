/**
 * @file stores.hpp
 * @brief Persistence contracts consumed by the orchestrator
 *
 * Production backends (databases, queues) live outside this library. The
 * in-process implementations in memory_store.hpp, file_workflow_store.hpp and
 * json_lines_log_sink.hpp satisfy these contracts for tests and local runs.
 *
 * All implementations report failures by throwing PersistenceError.
 */

#ifndef DAGFLOW_STORES_HPP
#define DAGFLOW_STORES_HPP

#include "execution_state.hpp"
#include "workflow_model.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Read-only source of workflow definitions
 */
class WorkflowStore {
public:
    virtual ~WorkflowStore() = default;

    /**
     * @brief Load a workflow by id
     *
     * @return The workflow, or std::nullopt if no workflow has that id
     * @throws PersistenceError If the backend cannot be read
     */
    virtual std::optional<workflow::Workflow> find(const std::string& workflow_id) const = 0;
};

/**
 * @brief Create-then-update store for execution records
 */
class ExecutionStore {
public:
    virtual ~ExecutionStore() = default;

    /**
     * @brief Persist a new record
     *
     * @param execution Record without an id
     * @return The stored record with its assigned id
     * @throws PersistenceError On write failure
     */
    virtual WorkflowExecution create(const WorkflowExecution& execution) = 0;

    /**
     * @brief Overwrite an existing record
     *
     * @throws PersistenceError If the id is unknown, the stored record is terminal,
     *         or the write fails
     */
    virtual void update(const WorkflowExecution& execution) = 0;

    virtual std::optional<WorkflowExecution> find(const std::string& execution_id) const = 0;

    virtual std::vector<WorkflowExecution> list_for_workflow(const std::string& workflow_id) const = 0;
};

/**
 * @brief One append-only record per node run
 */
struct NodeLogRecord {
    std::string execution_id;
    std::string node_id;
    std::string node_key;
    std::string node_type;
    std::string status;             // "completed" or "failed"
    nlohmann::json output_data;     // null on failure
    nlohmann::json error_data;      // null on success, else {message, code, details}
    double latency_ms;
    Timestamp completed_at;

    NodeLogRecord() : latency_ms(0.0) {}
};

namespace NodeLogStatus {
    constexpr const char* COMPLETED = "completed";
    constexpr const char* FAILED = "failed";
}

/**
 * @brief Destination for node-log records
 *
 * append() is called concurrently by nodes of the same group.
 */
class NodeLogSink {
public:
    virtual ~NodeLogSink() = default;

    /**
     * @throws PersistenceError On write failure
     */
    virtual void append(const NodeLogRecord& record) = 0;
};

} // namespace dagflow

#endif // DAGFLOW_STORES_HPP
