/**
 * @file memory_store.cpp
 * @brief Implementation of the in-memory stores and node-log sink
 */

#include "memory_store.hpp"
#include "errors.hpp"

namespace dagflow {

void MemoryWorkflowStore::put(const workflow::Workflow& workflow) {
    if (workflow.id.empty()) {
        throw PersistenceError("cannot store a workflow without an id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[workflow.id] = workflow;
}

bool MemoryWorkflowStore::remove(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.erase(workflow_id) > 0;
}

std::optional<workflow::Workflow> MemoryWorkflowStore::find(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(workflow_id);
    if (it == workflows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

MemoryExecutionStore::MemoryExecutionStore(const std::string& id_prefix)
    : id_prefix_(id_prefix), next_sequence_(1), update_count_(0) {}

WorkflowExecution MemoryExecutionStore::create(const WorkflowExecution& execution) {
    std::lock_guard<std::mutex> lock(mutex_);

    WorkflowExecution stored = execution;
    stored.id = id_prefix_ + "-" + std::to_string(next_sequence_++);
    executions_[stored.id] = stored;
    creation_order_.push_back(stored.id);
    return stored;
}

void MemoryExecutionStore::update(const WorkflowExecution& execution) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = executions_.find(execution.id);
    if (it == executions_.end()) {
        throw PersistenceError("unknown execution: " + execution.id);
    }
    if (it->second.is_terminal()) {
        throw PersistenceError("execution " + execution.id + " is already " +
                               status_to_string(it->second.status));
    }
    it->second = execution;
    ++update_count_;
}

std::optional<WorkflowExecution> MemoryExecutionStore::find(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(execution_id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<WorkflowExecution> MemoryExecutionStore::list_for_workflow(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowExecution> result;
    for (const auto& id : creation_order_) {
        const auto& execution = executions_.at(id);
        if (execution.workflow_id == workflow_id) {
            result.push_back(execution);
        }
    }
    return result;
}

size_t MemoryExecutionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_.size();
}

size_t MemoryExecutionStore::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

void MemoryNodeLogSink::append(const NodeLogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<NodeLogRecord> MemoryNodeLogSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<NodeLogRecord> MemoryNodeLogSink::records_for_execution(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeLogRecord> result;
    for (const auto& record : records_) {
        if (record.execution_id == execution_id) {
            result.push_back(record);
        }
    }
    return result;
}

size_t MemoryNodeLogSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void MemoryNodeLogSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace dagflow
