#include "file_store.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace dagflow {

FileWorkflowStore::FileWorkflowStore(const std::string& directory)
    : directory_(directory) {}

std::optional<workflow::Workflow> FileWorkflowStore::find(const std::string& workflow_id) const {
    if (workflow_id.empty() || workflow_id.find('/') != std::string::npos ||
        workflow_id.find('\\') != std::string::npos || workflow_id == "." || workflow_id == "..") {
        throw PersistenceError("invalid workflow id: '" + workflow_id + "'");
    }

    fs::path file = fs::path(directory_) / (workflow_id + ".json");
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (ec) {
            throw PersistenceError("cannot access " + file.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    workflow::Workflow loaded;
    try {
        loaded = config::parse_workflow_from_file(file.string());
    } catch (const config::ConfigParseError& e) {
        throw PersistenceError(e.what());
    }

    if (loaded.id.empty()) {
        loaded.id = workflow_id;
    } else if (loaded.id != workflow_id) {
        throw PersistenceError(file.string() + " declares id '" + loaded.id + "'");
    }
    return loaded;
}

JsonLinesNodeLogSink::JsonLinesNodeLogSink(const std::string& path)
    : path_(path), stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
        throw PersistenceError("failed to open node log file: " + path);
    }
}

void JsonLinesNodeLogSink::append(const NodeLogRecord& record) {
    nlohmann::json line = record;
    const std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << text << '\n';
    stream_.flush();
    if (!stream_) {
        throw PersistenceError("failed to write node log file: " + path_);
    }
}

} // namespace dagflow
