/**
 * @file file_store.hpp
 * @brief Filesystem-backed workflow store and node-log sink
 */

#ifndef DAGFLOW_FILE_STORE_HPP
#define DAGFLOW_FILE_STORE_HPP

#include "stores.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace dagflow {

/**
 * @brief Loads workflows from "<directory>/<workflow_id>.json"
 *
 * Files are parsed with parse_workflow_from_file(), so environment variables in
 * node configuration are expanded on every load. A file without an "id" takes
 * its id from the requested workflow id.
 */
class FileWorkflowStore : public WorkflowStore {
public:
    explicit FileWorkflowStore(const std::string& directory);

    /**
     * @return std::nullopt if no file exists for the id
     * @throws PersistenceError If the id is not a plain file name, the file is
     *         unreadable or malformed, or its "id" disagrees with the file name
     */
    std::optional<workflow::Workflow> find(const std::string& workflow_id) const override;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

/**
 * @brief Appends one JSON object per line to a file
 */
class JsonLinesNodeLogSink : public NodeLogSink {
public:
    /**
     * @throws PersistenceError If the file cannot be opened for appending
     */
    explicit JsonLinesNodeLogSink(const std::string& path);

    void append(const NodeLogRecord& record) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream stream_;
};

} // namespace dagflow

#endif // DAGFLOW_FILE_STORE_HPP
