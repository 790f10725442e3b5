#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/memory_store.hpp"
#include "../src/node_executor.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace dagflow;
using namespace dagflow::workflow;
using namespace dagflow::testing;

namespace {

class FailingSink : public NodeLogSink {
public:
    void append(const NodeLogRecord&) override {
        throw PersistenceError("disk full");
    }
};

nlohmann::json echo_input(const NodeExecutionContext& ctx) {
    return ctx.input;
}

} // namespace

TEST_CASE("Input assembly", "[node_executor]") {
    Workflow wf = diamond_workflow();
    nlohmann::json workflow_input = {{"seed", 7}};

    SECTION("Outputs are placed under the edge's target port") {
        NodeResultMap previous = {{"B", {{"b", 1}}}, {"C", {{"c", 2}}}};

        nlohmann::json input = NodeExecutor::assemble_input(wf, "D", workflow_input, previous);

        REQUIRE(input == nlohmann::json{{"left", {{"b", 1}}}, {"right", {{"c", 2}}}});
    }

    SECTION("Nodes without incoming edges receive the workflow input") {
        REQUIRE(NodeExecutor::assemble_input(wf, "A", workflow_input, {}) == workflow_input);
    }

    SECTION("Sources without an output contribute nothing") {
        NodeResultMap previous = {{"C", {{"c", 2}}}};

        nlohmann::json input = NodeExecutor::assemble_input(wf, "D", workflow_input, previous);

        REQUIRE(input == nlohmann::json{{"right", {{"c", 2}}}});
    }

    SECTION("No upstream output at all falls back to the workflow input") {
        REQUIRE(NodeExecutor::assemble_input(wf, "D", workflow_input, {}) == workflow_input);
    }

    SECTION("Empty target port keys the output by source node id") {
        Workflow wired = make_workflow("ports",
            {trigger_node("A"), task_node("B")},
            {WorkflowEdge("A", "B", "output", "")});

        nlohmann::json input = NodeExecutor::assemble_input(wired, "B", workflow_input, {{"A", 5}});

        REQUIRE(input == nlohmann::json{{"A", 5}});
    }

    SECTION("Default ports use the 'input' key") {
        nlohmann::json input = NodeExecutor::assemble_input(wf, "B", workflow_input, {{"A", {{"x", 1}}}});

        REQUIRE(input == nlohmann::json{{"input", {{"x", 1}}}});
    }
}

TEST_CASE("Node execution", "[node_executor]") {
    silence_logging();

    Workflow wf = diamond_workflow();
    HandlerRegistry registry;
    MemoryNodeLogSink sink;
    NodeExecutor executor(registry, &sink);
    NodeExecutionScope scope("exec-1");

    SECTION("Successful node returns handler output and logs once") {
        registry.register_handler("passthrough", echo_input);
        NodeResultMap previous = {{"A", {{"x", 1}}}};

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, previous, scope);

        REQUIRE(result.success);
        REQUIRE(result.output == nlohmann::json{{"input", {{"x", 1}}}});
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(result.metadata.retry_count == 0);
        REQUIRE(result.metadata.latency_ms >= 0.0);

        auto records = sink.records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].execution_id == "exec-1");
        REQUIRE(records[0].node_id == "B");
        REQUIRE(records[0].node_type == "passthrough");
        REQUIRE(records[0].status == "completed");
        REQUIRE(records[0].output_data == result.output);
        REQUIRE(records[0].error_data.is_null());
    }

    SECTION("Handler exceptions become failed results") {
        registry.register_handler("passthrough", [](const NodeExecutionContext&) -> nlohmann::json {
            throw std::runtime_error("boom");
        });

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, scope);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->message == "boom");
        REQUIRE(result.error->code == "HANDLER_EXCEPTION");

        auto records = sink.records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].status == "failed");
        REQUIRE(records[0].output_data.is_null());
        REQUIRE(records[0].error_data["message"] == "boom");
    }

    SECTION("NodeExecutionError supplies code and details") {
        registry.register_handler("passthrough", [](const NodeExecutionContext&) -> nlohmann::json {
            throw NodeExecutionError("rate limited", "RATE_LIMIT", {{"retry_after", 30}});
        });

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, scope);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error->message == "rate limited");
        REQUIRE(result.error->code == "RATE_LIMIT");
        REQUIRE(result.error->details["retry_after"] == 30);
    }

    SECTION("Node key is copied into the log record") {
        Workflow keyed = wf;
        keyed.definition.nodes[0].node_key = "start";
        registry.register_handler("trigger_manual", echo_input);

        executor.execute_node(keyed, keyed.definition.nodes[0], {{"x", 1}}, {}, scope);

        REQUIRE(sink.records()[0].node_key == "start");
    }

    SECTION("Handler sees configuration, previous outputs and identity") {
        Workflow configured = wf;
        configured.definition.nodes[1].config = {{"mode", "fast"}};
        registry.register_handler("passthrough", [](const NodeExecutionContext& ctx) {
            const nlohmann::json* a = ctx.previous_output("A");
            return nlohmann::json{
                {"mode", ctx.config["mode"]},
                {"a", a ? *a : nlohmann::json()},
                {"workflow", ctx.workflow_id},
                {"execution", ctx.execution_id},
                {"cancellable", ctx.cancellation.can_be_cancelled()}
            };
        });

        NodeResultMap previous = {{"A", 9}};
        NodeExecutionResult result = executor.execute_node(configured, configured.definition.nodes[1], {}, previous, scope);

        REQUIRE(result.output["mode"] == "fast");
        REQUIRE(result.output["a"] == 9);
        REQUIRE(result.output["workflow"] == "diamond");
        REQUIRE(result.output["execution"] == "exec-1");
        REQUIRE(result.output["cancellable"] == false);
    }

    SECTION("Latency covers the handler run") {
        registry.register_handler("passthrough", [](const NodeExecutionContext& ctx) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return ctx.input;
        });

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, scope);

        REQUIRE(result.metadata.latency_ms >= 15.0);
        REQUIRE(sink.records()[0].latency_ms == result.metadata.latency_ms);
    }

    SECTION("Unregistered node type succeeds with placeholder output") {
        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, scope);

        REQUIRE(result.success);
        REQUIRE(result.output["output"] == "Node type passthrough not implemented yet");
    }
}

TEST_CASE("Node retry policy", "[node_executor]") {
    silence_logging();

    Workflow wf = diamond_workflow();
    HandlerRegistry registry;
    MemoryNodeLogSink sink;

    RetryPolicy retry;
    retry.max_retries = 3;
    retry.delay_ms = 1;

    auto attempts = std::make_shared<std::atomic<int>>(0);

    SECTION("Transient failure succeeds on a later attempt") {
        registry.register_handler("passthrough", [attempts](const NodeExecutionContext&) {
            if (++(*attempts) < 3) {
                throw std::runtime_error("transient");
            }
            return nlohmann::json{{"attempt", attempts->load()}};
        });
        NodeExecutor executor(registry, &sink, retry);

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, NodeExecutionScope("e"));

        REQUIRE(result.success);
        REQUIRE(result.output["attempt"] == 3);
        REQUIRE(result.metadata.retry_count == 2);
        REQUIRE(sink.size() == 1);
    }

    SECTION("Retries stop at max_retries") {
        registry.register_handler("passthrough", [attempts](const NodeExecutionContext&) -> nlohmann::json {
            ++(*attempts);
            throw std::runtime_error("permanent");
        });
        NodeExecutor executor(registry, &sink, retry);

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, NodeExecutionScope("e"));

        REQUIRE_FALSE(result.success);
        REQUIRE(attempts->load() == 4);
        REQUIRE(result.metadata.retry_count == 3);
        REQUIRE(sink.size() == 1);
    }

    SECTION("Default policy makes a single attempt") {
        registry.register_handler("passthrough", [attempts](const NodeExecutionContext&) -> nlohmann::json {
            ++(*attempts);
            throw std::runtime_error("permanent");
        });
        NodeExecutor executor(registry, &sink);

        executor.execute_node(wf, *wf.find_node("B"), {}, {}, NodeExecutionScope("e"));

        REQUIRE(attempts->load() == 1);
    }

    SECTION("Cancelled executions are not retried") {
        registry.register_handler("passthrough", [attempts](const NodeExecutionContext&) -> nlohmann::json {
            ++(*attempts);
            throw std::runtime_error("permanent");
        });
        NodeExecutor executor(registry, &sink, retry);
        CancellationToken token = CancellationToken::create();
        token.cancel();

        NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, NodeExecutionScope("e", token));

        REQUIRE(attempts->load() == 1);
        REQUIRE(result.metadata.retry_count == 0);
    }

    SECTION("Backoff doubles the delay") {
        RetryPolicy policy;
        policy.delay_ms = 10;
        REQUIRE(policy.delay_for_retry(0) == 10);
        REQUIRE(policy.delay_for_retry(1) == 20);
        REQUIRE(policy.delay_for_retry(3) == 80);

        policy.exponential_backoff = false;
        REQUIRE(policy.delay_for_retry(3) == 10);
    }
}

TEST_CASE("Node log sink failures do not fail the node", "[node_executor]") {
    silence_logging();

    Workflow wf = diamond_workflow();
    HandlerRegistry registry;
    registry.register_handler("passthrough", echo_input);
    FailingSink sink;
    NodeExecutor executor(registry, &sink);

    std::vector<std::string> warnings;
    NodeExecutionResult result = executor.execute_node(wf, *wf.find_node("B"), {}, {}, NodeExecutionScope("e"), &warnings);

    REQUIRE(result.success);
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].find("disk full") != std::string::npos);
}
