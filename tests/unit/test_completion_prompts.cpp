#include <string>
#include <gtest/gtest.h>
#include "completion/completion_prompts.hpp"

namespace {

using taskwarden::completion::continuation_prompt;
using taskwarden::completion::partial_continuation_prompt;

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

TEST(CompletionPromptsTest, ContinuationPromptRemindsAboutCompleteTask) {
    const auto prompt = continuation_prompt();
    EXPECT_TRUE(contains(prompt, "REMINDER: You must call complete_task when finished."));
    EXPECT_TRUE(contains(prompt, "\"blocked\""));
}

TEST(CompletionPromptsTest, GenericPartialPromptAsksForPlan) {
    const auto prompt =
        partial_continuation_prompt("Write tests", "Build and test the parser", "Built it");
    EXPECT_TRUE(contains(prompt, "You called complete_task with status=\"partial\""));
    EXPECT_TRUE(contains(prompt, "## REQUIRED: Create a Continuation Plan"));
    EXPECT_TRUE(contains(prompt, "Build and test the parser"));
    EXPECT_TRUE(contains(prompt, "Built it"));
    EXPECT_TRUE(contains(prompt, "Write tests"));
    EXPECT_FALSE(contains(prompt, "rejected"));
}

TEST(CompletionPromptsTest, FocusedPromptListsOpenTodos) {
    const auto prompt = partial_continuation_prompt("ignored", "request", "summary",
                                                    std::string("- Write tests\n- Ship"));
    EXPECT_TRUE(contains(prompt, "Your complete_task call was rejected"));
    EXPECT_TRUE(contains(prompt, "- Write tests\n- Ship"));
    EXPECT_TRUE(contains(prompt, "todowrite"));
    EXPECT_FALSE(contains(prompt, "## REQUIRED: Create a Continuation Plan"));
}

}  // namespace
