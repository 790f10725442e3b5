#include "config_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dagflow {
namespace config {

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string require_string(const json& object, const char* field, const std::string& owner) {
    if (!object.contains(field)) {
        throw ConfigParseError(owner + " missing required field: " + field);
    }
    if (!object[field].is_string()) {
        throw ConfigParseError(owner + " field '" + field + "' must be a string");
    }
    return object[field].get<std::string>();
}

std::string optional_string(const json& object, const char* field, const std::string& fallback) {
    if (!object.contains(field) || object[field].is_null()) {
        return fallback;
    }
    return object[field].get<std::string>();
}

// Expands environment variables in every string nested inside value
void expand_strings(json& value) {
    if (value.is_string()) {
        value = expand_environment_variables(value.get<std::string>());
    } else if (value.is_structured()) {
        for (auto& element : value) {
            expand_strings(element);
        }
    }
}

workflow::WorkflowNode parse_node(const json& node_json, size_t index) {
    if (!node_json.is_object()) {
        throw ConfigParseError("Node at index " + std::to_string(index) + " must be an object");
    }

    workflow::WorkflowNode node;
    node.id = require_string(node_json, "id", "Node at index " + std::to_string(index));
    node.node_type = require_string(node_json, "node_type", "Node '" + node.id + "'");
    node.node_key = optional_string(node_json, "node_key", "");
    node.category = optional_string(node_json, "category", "");

    if (node_json.contains("config") && !node_json["config"].is_null()) {
        if (!node_json["config"].is_object()) {
            throw ConfigParseError("Node '" + node.id + "' field 'config' must be an object");
        }
        node.config = node_json["config"];
        expand_strings(node.config);
    }
    return node;
}

workflow::WorkflowEdge parse_edge(const json& edge_json, size_t index) {
    if (!edge_json.is_object()) {
        throw ConfigParseError("Edge at index " + std::to_string(index) + " must be an object");
    }

    const std::string owner = "Edge at index " + std::to_string(index);
    workflow::WorkflowEdge edge;
    edge.source_node_id = require_string(edge_json, "source_node_id", owner);
    edge.target_node_id = require_string(edge_json, "target_node_id", owner);
    edge.source_port = optional_string(edge_json, "source_port", "output");
    edge.target_port = optional_string(edge_json, "target_port", "input");
    return edge;
}

LogLevel parse_level(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        upper = "WARN";
    }
    if (upper != "DEBUG" && upper != "INFO" && upper != "WARN" && upper != "ERROR") {
        throw ConfigParseError("Unknown log level: " + value);
    }
    return string_to_level(upper);
}

FailurePolicy parse_failure_policy(const std::string& value) {
    if (value == "best_effort") return FailurePolicy::BEST_EFFORT;
    if (value == "fail_fast") return FailurePolicy::FAIL_FAST;
    throw ConfigParseError("Unknown failure_policy: " + value + " (expected best_effort or fail_fast)");
}

int64_t non_negative(const json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw ConfigParseError(std::string("retry.") + field + " must be an integer");
    }
    int64_t number = value.get<int64_t>();
    if (number < 0) {
        throw ConfigParseError(std::string("retry.") + field + " must not be negative");
    }
    return number;
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    size_t pos = 0;

    while (pos < value.size()) {
        if (value[pos] != '$') {
            result += value[pos++];
            continue;
        }

        size_t name_start = pos + 1;
        bool braces = name_start < value.size() && value[name_start] == '{';
        if (braces) {
            ++name_start;
        }

        size_t name_end = name_start;
        bool valid_start = name_start < value.size() &&
            !std::isdigit(static_cast<unsigned char>(value[name_start]));
        while (valid_start && name_end < value.size() && is_name_char(value[name_end])) {
            ++name_end;
        }

        bool closed = !braces || (name_end < value.size() && value[name_end] == '}');
        if (name_end == name_start || !closed) {
            // Not a variable reference; keep the '$' literally
            result += value[pos++];
            continue;
        }

        std::string var_name = value.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        if (env_value) {
            result += env_value;
        }
        pos = braces ? name_end + 1 : name_end;
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (fs::path(config_file_path).parent_path() / p).string();
}

workflow::Workflow parse_workflow(const json& document) {
    if (!document.is_object()) {
        throw ConfigParseError("Workflow must be a JSON object");
    }

    try {
        workflow::Workflow wf;
        wf.id = optional_string(document, "id", "");
        wf.name = optional_string(document, "name", "");

        const json& definition = document.contains("definition") ? document["definition"] : document;
        if (!definition.is_object()) {
            throw ConfigParseError("Field 'definition' must be an object");
        }
        if (!definition.contains("nodes")) {
            throw ConfigParseError("Missing required field: nodes");
        }
        if (!definition["nodes"].is_array()) {
            throw ConfigParseError("Field 'nodes' must be an array");
        }

        size_t index = 0;
        for (const auto& node_json : definition["nodes"]) {
            wf.definition.nodes.push_back(parse_node(node_json, index++));
        }

        if (definition.contains("edges") && !definition["edges"].is_null()) {
            if (!definition["edges"].is_array()) {
                throw ConfigParseError("Field 'edges' must be an array");
            }
            index = 0;
            for (const auto& edge_json : definition["edges"]) {
                wf.definition.edges.push_back(parse_edge(edge_json, index++));
            }
        }

        return wf;
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

workflow::Workflow parse_workflow_from_string(const std::string& json_string) {
    json document;
    try {
        document = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_workflow(document);
}

workflow::Workflow parse_workflow_from_file(const std::string& file_path) {
    return parse_workflow_from_string(read_file(file_path));
}

RuntimeConfig parse_runtime_config_from_string(const std::string& json_string) {
    RuntimeConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Runtime config must be a JSON object");
        }

        if (j.contains("failure_policy")) {
            config.orchestrator.failure_policy = parse_failure_policy(j["failure_policy"].get<std::string>());
        }

        if (j.contains("retry")) {
            const json& retry = j["retry"];
            if (retry.contains("max_retries")) {
                config.orchestrator.retry.max_retries =
                    static_cast<size_t>(non_negative(retry["max_retries"], "max_retries"));
            }
            if (retry.contains("delay_ms")) {
                config.orchestrator.retry.delay_ms = non_negative(retry["delay_ms"], "delay_ms");
            }
            if (retry.contains("exponential_backoff")) {
                config.orchestrator.retry.exponential_backoff = retry["exponential_backoff"].get<bool>();
            }
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = parse_level(logging["level"].get<std::string>());
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file") && !logging["file"].is_null()) {
                config.logging.enable_file = true;
                config.logging.log_file_path = expand_environment_variables(logging["file"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RuntimeConfig parse_runtime_config_from_file(const std::string& file_path) {
    RuntimeConfig config = parse_runtime_config_from_string(read_file(file_path));
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }
    return config;
}

} // namespace config
} // namespace dagflow
