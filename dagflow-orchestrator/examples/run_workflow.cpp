/**
 * @file run_workflow.cpp
 * @brief Command-line runner executing one workflow file with demonstration handlers
 *
 * Usage:
 *   dagflow-run <workflow.json> [input.json] [--config runtime.json] [--node-log nodes.jsonl]
 *
 * Registered node types:
 * - trigger_manual:  returns the execution input
 * - passthrough:     returns its wired input
 * - transform_merge: merges every object-valued input port into one object
 * - delay:           sleeps config.ms milliseconds, then returns its input
 * - fail:            throws NodeExecutionError with config.message
 * Any other type produces the "not implemented" placeholder.
 *
 * Prints the execution record as JSON on stdout. Exit status is 0 on a
 * completed execution, 1 on any error and 2 on bad usage.
 */

#include "../src/config_parser.hpp"
#include "../src/errors.hpp"
#include "../src/event_bus.hpp"
#include "../src/file_store.hpp"
#include "../src/json_codec.hpp"
#include "../src/memory_store.hpp"
#include "../src/orchestrator.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

using namespace dagflow;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <workflow.json> [input.json] [--config runtime.json] [--node-log nodes.jsonl]\n";
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw config::ConfigParseError("Failed to open input file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw config::ConfigParseError(path + ": " + e.what());
    }
}

void register_demo_handlers(HandlerRegistry& handlers) {
    handlers.register_handler("trigger_manual", [](const NodeExecutionContext& ctx) {
        return ctx.input;
    });

    handlers.register_handler("passthrough", [](const NodeExecutionContext& ctx) {
        return ctx.input;
    });

    handlers.register_handler("transform_merge", [](const NodeExecutionContext& ctx) {
        nlohmann::json merged = nlohmann::json::object();
        if (ctx.input.is_object()) {
            for (const auto& item : ctx.input.items()) {
                if (item.value().is_object()) {
                    merged.update(item.value());
                } else {
                    merged[item.key()] = item.value();
                }
            }
        }
        return merged;
    });

    handlers.register_handler("delay", [](const NodeExecutionContext& ctx) {
        int64_t ms = ctx.config.value("ms", int64_t(0));
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return ctx.input;
    });

    handlers.register_handler("fail", [](const NodeExecutionContext& ctx) -> nlohmann::json {
        throw NodeExecutionError(ctx.config.value("message", std::string("requested failure")),
                                 "DEMO_FAILURE", {{"node", ctx.node_id}});
    });
}

} // namespace

int main(int argc, char** argv) {
    std::string workflow_path;
    std::string input_path;
    std::string config_path;
    std::string node_log_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--node-log") && i + 1 < argc) {
            (arg == "--config" ? config_path : node_log_path) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            print_usage(argv[0]);
            return 2;
        } else if (workflow_path.empty()) {
            workflow_path = arg;
        } else if (input_path.empty()) {
            input_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (workflow_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        config::RuntimeConfig runtime;
        if (!config_path.empty()) {
            runtime = config::parse_runtime_config_from_file(config_path);
        }
        Logger::get_instance().configure(runtime.logging);

        workflow::Workflow wf = config::parse_workflow_from_file(workflow_path);
        if (wf.id.empty()) {
            wf.id = std::filesystem::path(workflow_path).stem().string();
        }
        nlohmann::json input = input_path.empty() ? nlohmann::json::object() : read_json_file(input_path);

        MemoryWorkflowStore workflows;
        workflows.put(wf);
        MemoryExecutionStore executions;
        HandlerRegistry handlers;
        register_demo_handlers(handlers);
        EventBus events;

        std::unique_ptr<NodeLogSink> node_logs;
        if (!node_log_path.empty()) {
            node_logs = std::make_unique<JsonLinesNodeLogSink>(node_log_path);
        }

        ExecutionOrchestrator orchestrator(workflows, executions, handlers, &events, node_logs.get(), runtime.orchestrator);

        WorkflowExecution execution = orchestrator.execute_workflow(wf.id, input, "cli");
        nlohmann::json output = execution;
        std::cout << output.dump(2) << std::endl;
        return 0;

    } catch (const ValidationError& e) {
        std::cerr << e.what() << std::endl;
        for (const auto& error : e.errors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return 1;
    } catch (const WorkflowError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
