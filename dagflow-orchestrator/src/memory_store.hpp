/**
 * @file memory_store.hpp
 * @brief In-process implementations of the persistence contracts
 */

#ifndef DAGFLOW_MEMORY_STORE_HPP
#define DAGFLOW_MEMORY_STORE_HPP

#include "stores.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dagflow {

/**
 * @brief Workflow store backed by a map
 */
class MemoryWorkflowStore : public WorkflowStore {
public:
    /**
     * @brief Add or replace a workflow
     *
     * @throws PersistenceError If the workflow id is empty
     */
    void put(const workflow::Workflow& workflow);

    bool remove(const std::string& workflow_id);

    std::optional<workflow::Workflow> find(const std::string& workflow_id) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, workflow::Workflow> workflows_;
};

/**
 * @brief Execution store backed by a map
 *
 * Ids are assigned as "<prefix>-<sequence>" in creation order. Terminal
 * records are immutable.
 */
class MemoryExecutionStore : public ExecutionStore {
public:
    explicit MemoryExecutionStore(const std::string& id_prefix = "exec");

    WorkflowExecution create(const WorkflowExecution& execution) override;
    void update(const WorkflowExecution& execution) override;
    std::optional<WorkflowExecution> find(const std::string& execution_id) const override;
    std::vector<WorkflowExecution> list_for_workflow(const std::string& workflow_id) const override;

    size_t size() const;

    /// Number of successful update() calls, for observing persistence order
    size_t update_count() const;

private:
    mutable std::mutex mutex_;
    std::string id_prefix_;
    size_t next_sequence_;
    size_t update_count_;
    std::map<std::string, WorkflowExecution> executions_;
    std::vector<std::string> creation_order_;
};

/**
 * @brief Node-log sink that keeps every record in memory
 */
class MemoryNodeLogSink : public NodeLogSink {
public:
    void append(const NodeLogRecord& record) override;

    std::vector<NodeLogRecord> records() const;
    std::vector<NodeLogRecord> records_for_execution(const std::string& execution_id) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<NodeLogRecord> records_;
};

} // namespace dagflow

#endif // DAGFLOW_MEMORY_STORE_HPP
