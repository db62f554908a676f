#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "completion/completion_enforcer.hpp"

namespace {

using taskwarden::completion::CompletionCallbacks;
using taskwarden::completion::CompletionEnforcer;
using taskwarden::completion::CompletionFlowState;
using taskwarden::completion::StepFinishAction;
using taskwarden::protocol::CompletionDeclaration;
using taskwarden::protocol::CompletionStatus;
using taskwarden::protocol::TodoItem;
using taskwarden::protocol::TodoList;
using taskwarden::protocol::TodoStatus;

struct DebugRecord {
    std::string type;
    std::string message;
    nlohmann::json data;
};

struct Recorder {
    std::vector<std::string> prompts;
    int completions = 0;
    std::vector<DebugRecord> debug;

    CompletionCallbacks callbacks() {
        return CompletionCallbacks{
            [this](const std::string& prompt) { prompts.push_back(prompt); },
            [this]() { ++completions; },
            [this](const std::string& type, const std::string& message,
                   const nlohmann::json& data) { debug.push_back({type, message, data}); }};
    }

    const DebugRecord* find(const std::string& type, const std::string& message_part) const {
        for (const auto& record : debug) {
            if (record.type == type && record.message.find(message_part) != std::string::npos) {
                return &record;
            }
        }
        return nullptr;
    }
};

CompletionDeclaration declare(const CompletionStatus status, const std::string& summary = "Done",
                              const std::string& request = "Test") {
    CompletionDeclaration decl;
    decl.status = status;
    decl.summary = summary;
    decl.original_request_summary = request;
    return decl;
}

TodoItem todo(const std::string& id, const std::string& content, const TodoStatus status) {
    TodoItem item;
    item.id = id;
    item.content = content;
    item.status = status;
    return item;
}

class CompletionEnforcerTest : public ::testing::Test {
protected:
    Recorder recorder_;
    CompletionEnforcer enforcer_{recorder_.callbacks()};
};

TEST_F(CompletionEnforcerTest, StartsIdle) {
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Idle);
    EXPECT_EQ(enforcer_.continuation_attempts(), 0u);
    EXPECT_EQ(enforcer_.max_continuation_attempts(), 10u);
    EXPECT_FALSE(enforcer_.is_in_continuation());
    EXPECT_FALSE(enforcer_.should_complete());
}

TEST_F(CompletionEnforcerTest, UpdateTodosStoresListAndLogs) {
    enforcer_.update_todos({todo("1", "Write code", TodoStatus::Pending),
                            todo("2", "Test", TodoStatus::Completed)});
    EXPECT_EQ(enforcer_.todos().size(), 2u);
    ASSERT_NE(recorder_.find("todo_update", "Todo list updated: 2 items"), nullptr);
    EXPECT_TRUE(enforcer_.tool_usage().requires_completion);
}

TEST_F(CompletionEnforcerTest, EmptyTodosDoNotRequireCompletion) {
    enforcer_.update_todos({});
    EXPECT_FALSE(enforcer_.tool_usage().requires_completion);
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Complete);
}

TEST_F(CompletionEnforcerTest, OnlyFirstDeclarationIsAccepted) {
    EXPECT_TRUE(enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success)));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Done);
    ASSERT_NE(recorder_.find("complete_task", "complete_task detected with status: success"),
              nullptr);

    EXPECT_FALSE(enforcer_.handle_complete_task_detection(declare(CompletionStatus::Blocked)));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Done);
    EXPECT_EQ(enforcer_.declaration()->status, CompletionStatus::Success);
}

TEST_F(CompletionEnforcerTest, SuccessWithOpenTodosIsDowngraded) {
    enforcer_.update_todos({todo("1", "Write code", TodoStatus::Completed),
                            todo("2", "Write tests", TodoStatus::InProgress),
                            todo("3", "Ship", TodoStatus::Pending),
                            todo("4", "Gold plate", TodoStatus::Cancelled)});

    EXPECT_TRUE(enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success)));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::PartialContinuationPending);
    ASSERT_TRUE(enforcer_.declaration().has_value());
    EXPECT_EQ(enforcer_.declaration()->status, CompletionStatus::Partial);
    EXPECT_EQ(enforcer_.declaration()->remaining_work.value(), "- Write tests\n- Ship");
    ASSERT_NE(recorder_.find("incomplete_todos", "downgrading to partial"), nullptr);
}

TEST_F(CompletionEnforcerTest, SuccessWithResolvedTodosStaysSuccess) {
    enforcer_.update_todos({todo("1", "Write code", TodoStatus::Completed),
                            todo("2", "Skip", TodoStatus::Cancelled)});
    EXPECT_TRUE(enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success)));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Done);
}

TEST_F(CompletionEnforcerTest, MissingInputIsTreatedAsBlocked) {
    EXPECT_TRUE(enforcer_.handle_complete_task_detection(nlohmann::json()));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Blocked);
    EXPECT_TRUE(enforcer_.should_complete());
}

TEST_F(CompletionEnforcerTest, NonTerminalReasonsContinue) {
    enforcer_.mark_tools_used();
    EXPECT_EQ(enforcer_.handle_step_finish("tool_use"), StepFinishAction::Continue);
    EXPECT_EQ(enforcer_.handle_step_finish(""), StepFinishAction::Continue);
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Idle);
}

TEST_F(CompletionEnforcerTest, PartialDeclarationMakesStepFinishPending) {
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Partial));
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Pending);
    ASSERT_NE(recorder_.find("partial_continuation",
                             "Scheduling continuation for partial completion"),
              nullptr);
}

TEST_F(CompletionEnforcerTest, ConversationalTurnCompletes) {
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Complete);
    ASSERT_NE(recorder_.find("skip_continuation", "treating as conversational response"),
              nullptr);
    EXPECT_EQ(enforcer_.continuation_attempts(), 0u);
}

TEST_F(CompletionEnforcerTest, ToolsWithoutDeclarationSchedulesContinuation) {
    enforcer_.mark_tools_used();
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Pending);
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::ContinuationPending);
    ASSERT_NE(recorder_.find("continuation", "Scheduled continuation prompt (attempt 1)"),
              nullptr);
}

TEST_F(CompletionEnforcerTest, HelperToolsAloneStayConversational) {
    enforcer_.mark_tools_used(false);
    enforcer_.mark_tools_used(false);
    EXPECT_TRUE(enforcer_.tool_usage().helper_tools_this_turn);
    EXPECT_TRUE(enforcer_.tool_usage().any_tools_this_turn());
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Complete);
}

TEST_F(CompletionEnforcerTest, PlannedTaskNeedsDeclarationEvenWithoutTools) {
    enforcer_.mark_task_requires_completion();
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Pending);
}

TEST_F(CompletionEnforcerTest, RealToolUseIsSticky) {
    enforcer_.mark_tools_used(true);
    enforcer_.mark_tools_used(false);
    EXPECT_FALSE(enforcer_.tool_usage().is_conversational());
}

TEST_F(CompletionEnforcerTest, SuccessDeclarationCompletes) {
    enforcer_.mark_tools_used();
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success));
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Complete);
    EXPECT_EQ(enforcer_.handle_step_finish("end_turn"), StepFinishAction::Complete);
    EXPECT_EQ(enforcer_.continuation_attempts(), 0u);
}

TEST_F(CompletionEnforcerTest, EndTurnBehavesLikeStop) {
    enforcer_.mark_tools_used();
    EXPECT_EQ(enforcer_.handle_step_finish("end_turn"), StepFinishAction::Pending);
}

TEST_F(CompletionEnforcerTest, ExitStartsPartialContinuation) {
    CompletionDeclaration decl = declare(CompletionStatus::Partial, "Did half", "Do everything");
    decl.remaining_work = "The other half";
    enforcer_.handle_complete_task_detection(decl);

    enforcer_.handle_process_exit(0);
    ASSERT_EQ(recorder_.prompts.size(), 1u);
    EXPECT_NE(recorder_.prompts[0].find("The other half"), std::string::npos);
    EXPECT_NE(recorder_.prompts[0].find("Do everything"), std::string::npos);
    EXPECT_EQ(recorder_.completions, 0);
    EXPECT_EQ(enforcer_.continuation_attempts(), 1u);
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Idle);
    EXPECT_TRUE(enforcer_.is_in_continuation());

    const auto* record = recorder_.find("partial_continuation", "Starting partial continuation");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->data["continuationPrompt"], recorder_.prompts[0]);
}

TEST_F(CompletionEnforcerTest, ExitStartsGenericContinuation) {
    enforcer_.mark_tools_used();
    enforcer_.handle_step_finish("stop");

    enforcer_.handle_process_exit(0);
    ASSERT_EQ(recorder_.prompts.size(), 1u);
    EXPECT_NE(recorder_.prompts[0].find("REMINDER: You must call complete_task"),
              std::string::npos);
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Idle);
    ASSERT_NE(recorder_.find("continuation", "Starting continuation task (attempt 1)"), nullptr);
}

TEST_F(CompletionEnforcerTest, TodoDowngradeUsesFocusedPrompt) {
    enforcer_.update_todos({todo("1", "Write tests", TodoStatus::Pending)});
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success));

    enforcer_.handle_process_exit(0);
    ASSERT_EQ(recorder_.prompts.size(), 1u);
    EXPECT_NE(recorder_.prompts[0].find("rejected"), std::string::npos);
    EXPECT_NE(recorder_.prompts[0].find("- Write tests"), std::string::npos);
    EXPECT_NE(recorder_.prompts[0].find("todowrite"), std::string::npos);
}

TEST_F(CompletionEnforcerTest, GenuinePartialUsesPlanPrompt) {
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Partial));

    enforcer_.handle_process_exit(0);
    ASSERT_EQ(recorder_.prompts.size(), 1u);
    EXPECT_NE(recorder_.prompts[0].find("## REQUIRED: Create a Continuation Plan"),
              std::string::npos);
    EXPECT_EQ(recorder_.prompts[0].find("rejected"), std::string::npos);
}

TEST_F(CompletionEnforcerTest, PartialExitPromptNamesPartialStatus) {
    CompletionDeclaration decl = declare(CompletionStatus::Partial, "x");
    decl.remaining_work = "y";
    enforcer_.handle_complete_task_detection(decl);

    enforcer_.handle_process_exit(0);
    ASSERT_EQ(recorder_.prompts.size(), 1u);
    EXPECT_NE(recorder_.prompts[0].find("status=\"partial\""), std::string::npos);
    EXPECT_EQ(recorder_.completions, 0);
}

TEST_F(CompletionEnforcerTest, BlockedExitFinalizesWithoutContinuation) {
    CompletionDeclaration decl = declare(CompletionStatus::Blocked, "x");
    decl.blocker = "Missing credentials";
    enforcer_.mark_tools_used();
    enforcer_.handle_complete_task_detection(decl);

    enforcer_.handle_process_exit(0);
    EXPECT_TRUE(recorder_.prompts.empty());
    EXPECT_EQ(recorder_.completions, 1);
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Blocked);
    EXPECT_FALSE(enforcer_.is_in_continuation());
}

TEST_F(CompletionEnforcerTest, TextOnlyContinuationTurnKeepsContinuing) {
    enforcer_.mark_tools_used();
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Pending);
    enforcer_.handle_process_exit(0);

    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Pending);
    ASSERT_NE(recorder_.find("continuation", "Scheduled continuation prompt (attempt 2)"),
              nullptr);
}

TEST_F(CompletionEnforcerTest, CleanExitWithNothingPendingCompletes) {
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success));
    enforcer_.handle_process_exit(0);
    EXPECT_EQ(recorder_.completions, 1);
    EXPECT_TRUE(recorder_.prompts.empty());
}

TEST_F(CompletionEnforcerTest, NonZeroExitCompletesWithoutContinuation) {
    enforcer_.mark_tools_used();
    enforcer_.handle_step_finish("stop");

    enforcer_.handle_process_exit(1);
    EXPECT_EQ(recorder_.completions, 1);
    EXPECT_TRUE(recorder_.prompts.empty());
}

TEST_F(CompletionEnforcerTest, ExhaustedPartialBudgetCompletes) {
    Recorder recorder;
    CompletionEnforcer limited(recorder.callbacks(), 0);
    limited.handle_complete_task_detection(declare(CompletionStatus::Partial));

    limited.handle_process_exit(0);
    EXPECT_EQ(recorder.completions, 1);
    EXPECT_TRUE(recorder.prompts.empty());
    EXPECT_EQ(limited.state(), CompletionFlowState::MaxRetriesReached);
}

TEST_F(CompletionEnforcerTest, ShouldCompleteOnlyInTerminalStates) {
    enforcer_.mark_tools_used();
    enforcer_.handle_step_finish("stop");
    EXPECT_FALSE(enforcer_.should_complete());

    Recorder blocked_recorder;
    CompletionEnforcer blocked(blocked_recorder.callbacks());
    blocked.handle_complete_task_detection(declare(CompletionStatus::Blocked));
    EXPECT_TRUE(blocked.should_complete());
}

TEST_F(CompletionEnforcerTest, CircuitBreakerStopsContinuations) {
    Recorder recorder;
    CompletionEnforcer limited(recorder.callbacks(), 3);

    for (std::uint32_t attempt = 1; attempt <= 3; ++attempt) {
        limited.mark_tools_used();
        EXPECT_EQ(limited.handle_step_finish("stop"), StepFinishAction::Pending);
        limited.handle_process_exit(0);
        EXPECT_EQ(limited.continuation_attempts(), attempt);
        EXPECT_EQ(recorder.prompts.size(), attempt);
    }

    limited.mark_tools_used();
    EXPECT_EQ(limited.handle_step_finish("stop"), StepFinishAction::Complete);
    EXPECT_EQ(limited.state(), CompletionFlowState::MaxRetriesReached);
    EXPECT_TRUE(limited.should_complete());

    limited.handle_process_exit(0);
    EXPECT_EQ(recorder.completions, 1);
    EXPECT_EQ(recorder.prompts.size(), 3u);
}

TEST_F(CompletionEnforcerTest, SuccessAfterDowngradeIsAcceptedInNextWindow) {
    enforcer_.update_todos({todo("1", "Navigate", TodoStatus::InProgress)});
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success));
    enforcer_.handle_process_exit(0);
    EXPECT_TRUE(enforcer_.is_in_continuation());

    enforcer_.update_todos({todo("1", "Navigate", TodoStatus::Completed)});
    EXPECT_TRUE(enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success)));
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Done);
    EXPECT_FALSE(enforcer_.is_in_continuation());
}

TEST_F(CompletionEnforcerTest, ResetReturnsToConversational) {
    enforcer_.update_todos({todo("1", "Task", TodoStatus::Pending)});
    enforcer_.mark_tools_used();
    enforcer_.mark_task_requires_completion();
    enforcer_.handle_complete_task_detection(declare(CompletionStatus::Success));
    enforcer_.handle_process_exit(0);
    EXPECT_TRUE(enforcer_.is_in_continuation());

    enforcer_.reset();
    EXPECT_EQ(enforcer_.state(), CompletionFlowState::Idle);
    EXPECT_EQ(enforcer_.continuation_attempts(), 0u);
    EXPECT_TRUE(enforcer_.todos().empty());
    EXPECT_FALSE(enforcer_.is_in_continuation());
    EXPECT_FALSE(enforcer_.declaration().has_value());
    EXPECT_EQ(enforcer_.handle_step_finish("stop"), StepFinishAction::Complete);
}

}  // namespace
