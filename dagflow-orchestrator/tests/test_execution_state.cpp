#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/execution_arena.hpp"
#include "../src/execution_state.hpp"

using namespace dagflow;

TEST_CASE("Execution status state machine", "[execution_state]") {
    SECTION("Forward transitions are allowed") {
        REQUIRE(is_valid_transition(ExecutionStatus::CREATED, ExecutionStatus::RUNNING));
        REQUIRE(is_valid_transition(ExecutionStatus::RUNNING, ExecutionStatus::COMPLETED));
        REQUIRE(is_valid_transition(ExecutionStatus::RUNNING, ExecutionStatus::FAILED));
    }

    SECTION("Skipping, reversing and leaving terminal states is not") {
        REQUIRE_FALSE(is_valid_transition(ExecutionStatus::CREATED, ExecutionStatus::COMPLETED));
        REQUIRE_FALSE(is_valid_transition(ExecutionStatus::RUNNING, ExecutionStatus::CREATED));
        REQUIRE_FALSE(is_valid_transition(ExecutionStatus::RUNNING, ExecutionStatus::RUNNING));
        REQUIRE_FALSE(is_valid_transition(ExecutionStatus::COMPLETED, ExecutionStatus::FAILED));
        REQUIRE_FALSE(is_valid_transition(ExecutionStatus::FAILED, ExecutionStatus::RUNNING));
    }

    SECTION("transition() enforces the rules and stamps completion") {
        WorkflowExecution execution;
        REQUIRE(execution.status == ExecutionStatus::CREATED);
        REQUIRE_FALSE(execution.completed_at.has_value());

        execution.transition(ExecutionStatus::RUNNING);
        REQUIRE_FALSE(execution.completed_at.has_value());

        execution.transition(ExecutionStatus::COMPLETED);
        REQUIRE(execution.is_terminal());
        REQUIRE(execution.completed_at.has_value());

        REQUIRE_THROWS_AS(execution.transition(ExecutionStatus::FAILED), InvalidStateTransition);
        REQUIRE(execution.status == ExecutionStatus::COMPLETED);
    }

    SECTION("Invalid transition message names both states") {
        InvalidStateTransition error(ExecutionStatus::COMPLETED, ExecutionStatus::RUNNING);
        REQUIRE(std::string(error.what()) == "Invalid execution state transition: completed -> running");
        REQUIRE(error.from() == ExecutionStatus::COMPLETED);
        REQUIRE(error.to() == ExecutionStatus::RUNNING);
    }
}

TEST_CASE("Execution status strings", "[execution_state]") {
    for (auto status : {ExecutionStatus::CREATED, ExecutionStatus::RUNNING,
                        ExecutionStatus::COMPLETED, ExecutionStatus::FAILED}) {
        REQUIRE(string_to_status(status_to_string(status)) == status);
    }
    REQUIRE(status_to_string(ExecutionStatus::RUNNING) == "running");
    REQUIRE_THROWS_AS(string_to_status("paused"), std::invalid_argument);
}

TEST_CASE("Execution arena", "[execution_state]") {
    ExecutionArena arena;

    arena.record("A", NodeExecutionResult::succeeded({{"value", 1}}));
    arena.record("B", NodeExecutionResult::failed(NodeError("bad input", "VALIDATION")));

    SECTION("Only successful outputs are visible to later nodes") {
        REQUIRE(arena.outputs().size() == 1);
        REQUIRE(arena.outputs().at("A") == nlohmann::json{{"value", 1}});
        REQUIRE(arena.outputs_as_json() == nlohmann::json{{"A", {{"value", 1}}}});
    }

    SECTION("Every result is kept") {
        REQUIRE(arena.size() == 2);
        REQUIRE(arena.contains("B"));
        REQUIRE_FALSE(arena.results().at("B").success);
        REQUIRE(arena.failed_nodes() == std::vector<std::string>{"B"});
    }

    SECTION("Each node is recorded at most once") {
        REQUIRE_THROWS_AS(arena.record("A", NodeExecutionResult::succeeded(2)), OrchestrationError);
        REQUIRE(arena.outputs().at("A") == nlohmann::json{{"value", 1}});
    }
}
