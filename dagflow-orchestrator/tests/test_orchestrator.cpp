/**
 * @file test_orchestrator.cpp
 * @brief End-to-end tests for ExecutionOrchestrator
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/memory_store.hpp"
#include "../src/orchestrator.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace dagflow;
using namespace dagflow::workflow;
using namespace dagflow::testing;

// ============================================================================
// Test Fixtures and Helpers
// ============================================================================

namespace {

struct RecordedEvent {
    std::string name;
    nlohmann::json payload;
};

/**
 * In-memory collaborators wired to an orchestrator; records every emitted event
 */
struct Harness {
    MemoryWorkflowStore workflows;
    MemoryExecutionStore executions;
    HandlerRegistry handlers;
    EventBus events;
    MemoryNodeLogSink node_logs;
    std::vector<RecordedEvent> emitted;

    Harness() {
        silence_logging();
        events.subscribe("*", [this](const std::string& name, const nlohmann::json& payload) {
            emitted.push_back({name, payload});
        });
        handlers.register_handler("trigger_manual", [](const NodeExecutionContext& ctx) {
            return ctx.input;
        });
        handlers.register_handler("passthrough", [](const NodeExecutionContext& ctx) {
            return nlohmann::json{{"from", ctx.node_id}, {"input", ctx.input}};
        });
    }

    ExecutionOrchestrator orchestrator(const OrchestratorConfig& config = OrchestratorConfig()) {
        return ExecutionOrchestrator(workflows, executions, handlers, &events, &node_logs, config);
    }

    std::vector<std::string> event_names() const {
        std::vector<std::string> names;
        for (const auto& event : emitted) {
            names.push_back(event.name);
        }
        return names;
    }
};

class RejectingUpdateStore : public MemoryExecutionStore {
public:
    void update(const WorkflowExecution&) override {
        throw PersistenceError("connection reset");
    }
};

class RejectingCreateStore : public MemoryExecutionStore {
public:
    WorkflowExecution create(const WorkflowExecution&) override {
        throw PersistenceError("read-only replica");
    }
};

} // namespace

// ============================================================================
// Successful executions
// ============================================================================

TEST_CASE("Diamond workflow runs to completion", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    auto orchestrator = h.orchestrator();

    WorkflowExecution execution = orchestrator.execute_workflow("wf-1", {{"seed", 1}}, "user-42");

    SECTION("Execution record") {
        REQUIRE_FALSE(execution.id.empty());
        REQUIRE(execution.workflow_id == "wf-1");
        REQUIRE(execution.status == ExecutionStatus::COMPLETED);
        REQUIRE(execution.triggered_by == "user-42");
        REQUIRE(execution.input_data == nlohmann::json{{"seed", 1}});
        REQUIRE(execution.completed_at.has_value());
        REQUIRE(*execution.completed_at >= execution.started_at);
        REQUIRE_FALSE(execution.error_data.has_value());
        REQUIRE_FALSE(execution.has_node_failures);
        REQUIRE(execution.failed_nodes.empty());
        REQUIRE(execution.warnings.empty());
    }

    SECTION("Result data holds every node output keyed by node id") {
        REQUIRE(execution.result_data.size() == 4);
        REQUIRE(execution.result_data["A"] == nlohmann::json{{"seed", 1}});
        REQUIRE(execution.result_data["B"]["input"] == nlohmann::json{{"input", {{"seed", 1}}}});

        const nlohmann::json& d_input = execution.result_data["D"]["input"];
        REQUIRE(d_input["left"]["from"] == "B");
        REQUIRE(d_input["right"]["from"] == "C");
    }

    SECTION("Stored record matches the returned one") {
        auto stored = h.executions.find(execution.id);
        REQUIRE(stored.has_value());
        REQUIRE(stored->status == ExecutionStatus::COMPLETED);
        REQUIRE(stored->result_data == execution.result_data);
        REQUIRE(h.executions.list_for_workflow("wf-1").size() == 1);
        REQUIRE(h.executions.update_count() == 1);
    }

    SECTION("Lifecycle events are emitted in order") {
        REQUIRE(h.event_names() == std::vector<std::string>{"execution:started", "execution:completed"});

        const auto& started = h.emitted[0].payload;
        REQUIRE(started["workflowId"] == "wf-1");
        REQUIRE(started["executionId"] == execution.id);
        REQUIRE(started["triggeredBy"] == "user-42");

        const auto& completed = h.emitted[1].payload;
        REQUIRE(completed["executionId"] == execution.id);
        REQUIRE(completed["result"] == execution.result_data);
    }

    SECTION("Exactly one node log record per node") {
        auto records = h.node_logs.records_for_execution(execution.id);
        REQUIRE(records.size() == 4);
        for (const std::string& node_id : {"A", "B", "C", "D"}) {
            auto count = std::count_if(records.begin(), records.end(),
                                       [&](const NodeLogRecord& r) { return r.node_id == node_id; });
            REQUIRE(count == 1);
        }
    }
}

TEST_CASE("Nodes of one group run concurrently", "[orchestrator]") {
    Harness h;
    h.workflows.put(make_workflow("fan-out",
        {trigger_node("T"), task_node("A", "slow"), task_node("B", "slow"), task_node("C", "slow")},
        {WorkflowEdge("T", "A"), WorkflowEdge("T", "B"), WorkflowEdge("T", "C")}));

    auto active = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    h.handlers.register_handler("slow", [active, peak](const NodeExecutionContext&) {
        int now = ++(*active);
        int seen = peak->load();
        while (now > seen && !peak->compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        --(*active);
        return nlohmann::json{{"done", true}};
    });

    WorkflowExecution execution = h.orchestrator().execute_workflow("fan-out", {}, "test");

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(peak->load() >= 2);
    REQUIRE(active->load() == 0);
}

TEST_CASE("Later groups see outputs of every earlier group", "[orchestrator]") {
    Harness h;
    h.workflows.put(make_workflow("chain",
        {trigger_node("A"), task_node("B"), task_node("C", "inspect")},
        {WorkflowEdge("A", "B"), WorkflowEdge("B", "C")}));
    h.handlers.register_handler("inspect", [](const NodeExecutionContext& ctx) {
        return nlohmann::json{
            {"saw_a", ctx.previous_output("A") != nullptr},
            {"saw_b", ctx.previous_output("B") != nullptr},
            {"previous_count", ctx.previous_nodes->size()}
        };
    });

    WorkflowExecution execution = h.orchestrator().execute_workflow("chain", {{"x", 1}}, "test");

    REQUIRE(execution.result_data["C"]["saw_a"] == true);
    REQUIRE(execution.result_data["C"]["saw_b"] == true);
    REQUIRE(execution.result_data["C"]["previous_count"] == 2);
}

TEST_CASE("Unregistered node types produce a placeholder output", "[orchestrator]") {
    Harness h;
    h.workflows.put(make_workflow("placeholder",
        {trigger_node("T"), task_node("X", "action_send_slack")},
        {WorkflowEdge("T", "X")}));

    WorkflowExecution execution = h.orchestrator().execute_workflow("placeholder", {}, "test");

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE_FALSE(execution.has_node_failures);
    REQUIRE(execution.result_data["X"]["output"] == "Node type action_send_slack not implemented yet");
}

// ============================================================================
// Rejected before any record exists
// ============================================================================

TEST_CASE("Missing workflow is rejected without a record", "[orchestrator]") {
    Harness h;

    REQUIRE_THROWS_AS(h.orchestrator().execute_workflow("nope", {}, "test"), NotFoundError);
    REQUIRE(h.executions.size() == 0);
    REQUIRE(h.emitted.empty());
}

TEST_CASE("Invalid workflows are rejected without a record", "[orchestrator]") {
    Harness h;

    SECTION("Empty workflow") {
        h.workflows.put(make_workflow("empty", {}));

        try {
            h.orchestrator().execute_workflow("empty", {}, "test");
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.errors() == std::vector<std::string>{"Workflow must have at least one node"});
            REQUIRE(std::string(e.what()).find("must have at least one node") != std::string::npos);
        }
    }

    SECTION("Cyclic workflow") {
        h.workflows.put(make_workflow("cycle",
            {task_node("A"), task_node("B")},
            {WorkflowEdge("A", "B"), WorkflowEdge("B", "A")}));

        REQUIRE_THROWS_AS(h.orchestrator().execute_workflow("cycle", {}, "test"), ValidationError);
    }

    REQUIRE(h.executions.size() == 0);
    REQUIRE(h.node_logs.size() == 0);
    REQUIRE(h.emitted.empty());
}

TEST_CASE("Record creation failure propagates", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    RejectingCreateStore store;
    ExecutionOrchestrator orchestrator(h.workflows, store, h.handlers, &h.events, &h.node_logs);

    REQUIRE_THROWS_AS(orchestrator.execute_workflow("wf-1", {}, "test"), PersistenceError);
    REQUIRE(h.emitted.empty());
    REQUIRE(h.node_logs.size() == 0);
}

// ============================================================================
// Node failures
// ============================================================================

TEST_CASE("Failed node is isolated from its siblings", "[orchestrator]") {
    Harness h;
    Workflow wf = diamond_workflow("wf-1");
    wf.definition.nodes[1].node_type = "explode";   // B
    h.workflows.put(wf);
    h.handlers.register_handler("explode", [](const NodeExecutionContext&) -> nlohmann::json {
        throw std::runtime_error("B exploded");
    });

    WorkflowExecution execution = h.orchestrator().execute_workflow("wf-1", {{"seed", 1}}, "test");

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.has_node_failures);
    REQUIRE(execution.failed_nodes == std::vector<std::string>{"B"});

    const NodeExecutionResult& b = execution.node_results.at("B");
    REQUIRE_FALSE(b.success);
    REQUIRE(b.error->message == "B exploded");
    REQUIRE(execution.node_results.at("C").success);

    SECTION("Failed node is absent from result data") {
        REQUIRE_FALSE(execution.result_data.contains("B"));
        REQUIRE(execution.result_data.contains("C"));
    }

    SECTION("Downstream node receives only the successful input") {
        const nlohmann::json& d_input = execution.result_data["D"]["input"];
        REQUIRE_FALSE(d_input.contains("left"));
        REQUIRE(d_input["right"]["from"] == "C");
    }

    SECTION("The failure is recorded in the node log") {
        auto records = h.node_logs.records();
        auto it = std::find_if(records.begin(), records.end(),
                               [](const NodeLogRecord& r) { return r.node_id == "B"; });
        REQUIRE(it != records.end());
        REQUIRE(it->status == "failed");
        REQUIRE(it->error_data["message"] == "B exploded");
    }
}

TEST_CASE("FAIL_FAST turns a failed node into a failed execution", "[orchestrator]") {
    Harness h;
    Workflow wf = diamond_workflow("wf-1");
    wf.definition.nodes[1].node_type = "explode";
    h.workflows.put(wf);
    h.handlers.register_handler("explode", [](const NodeExecutionContext&) -> nlohmann::json {
        throw std::runtime_error("B exploded");
    });

    OrchestratorConfig config;
    config.failure_policy = FailurePolicy::FAIL_FAST;
    auto orchestrator = h.orchestrator(config);

    REQUIRE_THROWS_AS(orchestrator.execute_workflow("wf-1", {}, "test"), OrchestrationError);

    auto stored = h.executions.list_for_workflow("wf-1");
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].status == ExecutionStatus::FAILED);
    REQUIRE(stored[0].error_data.has_value());
    REQUIRE(stored[0].error_data->message == "Node B failed: B exploded");
    REQUIRE(stored[0].completed_at.has_value());

    // C shares B's group and still ran; D never did
    REQUIRE(h.node_logs.size() == 3);

    REQUIRE(h.event_names() == std::vector<std::string>{"execution:started", "execution:failed"});
    REQUIRE(h.emitted[1].payload["error"] == "Node B failed: B exploded");
    REQUIRE(h.emitted[1].payload["executionId"] == stored[0].id);
}

// ============================================================================
// Orchestration faults
// ============================================================================

TEST_CASE("Cancellation is observed at the next group boundary", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    CancellationToken token = CancellationToken::create();

    h.handlers.replace_handler("trigger_manual", std::make_shared<FunctionHandler>(
        [token](const NodeExecutionContext& ctx) mutable {
            token.cancel();
            return ctx.input;
        }));

    REQUIRE_THROWS_AS(h.orchestrator().execute_workflow("wf-1", {}, "test", token), ExecutionCancelled);

    auto stored = h.executions.list_for_workflow("wf-1");
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].status == ExecutionStatus::FAILED);
    REQUIRE(stored[0].error_data->stack.find("ExecutionCancelled") != std::string::npos);
    REQUIRE(stored[0].error_data->stack.find("group 1") != std::string::npos);

    // Only the trigger ran
    REQUIRE(h.node_logs.size() == 1);
    REQUIRE(h.event_names().back() == "execution:failed");
}

TEST_CASE("Token cancelled before start fails before any node runs", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    CancellationToken token = CancellationToken::create();
    token.cancel();

    REQUIRE_THROWS_AS(h.orchestrator().execute_workflow("wf-1", {}, "test", token), ExecutionCancelled);
    REQUIRE(h.node_logs.size() == 0);
    REQUIRE(h.executions.list_for_workflow("wf-1")[0].status == ExecutionStatus::FAILED);
}

// ============================================================================
// Collaborator failures
// ============================================================================

TEST_CASE("Update failures are surfaced as warnings", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    RejectingUpdateStore store;
    ExecutionOrchestrator orchestrator(h.workflows, store, h.handlers, &h.events, &h.node_logs);

    WorkflowExecution execution = orchestrator.execute_workflow("wf-1", {}, "test");

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(execution.warnings.size() == 1);
    REQUIRE(execution.warnings[0].find("connection reset") != std::string::npos);
    REQUIRE(h.event_names().back() == "execution:completed");
}

TEST_CASE("Throwing listeners do not affect the execution", "[orchestrator]") {
    Harness h;
    h.workflows.put(diamond_workflow("wf-1"));
    h.events.subscribe(LifecycleEvent::STARTED, [](const std::string&, const nlohmann::json&) {
        throw std::runtime_error("listener bug");
    });

    WorkflowExecution execution = h.orchestrator().execute_workflow("wf-1", {}, "test");

    REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    REQUIRE(h.event_names() == std::vector<std::string>{"execution:started", "execution:completed"});
}

TEST_CASE("validate and plan pass through", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();

    REQUIRE(orchestrator.validate(diamond_workflow()).valid);
    REQUIRE(orchestrator.plan(diamond_workflow()).parallel_groups.size() == 3);
    REQUIRE(orchestrator.config().failure_policy == FailurePolicy::BEST_EFFORT);
    REQUIRE(orchestrator.config().retry.max_retries == 0);
}
