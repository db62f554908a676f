#include "completion/completion_prompts.hpp"

#include <sstream>

namespace taskwarden::completion {

std::string continuation_prompt() {
    return "REMINDER: You must call complete_task when finished.\n"
           "\n"
           "Check first: have you actually finished everything the user asked for?\n"
           "\n"
           "- Not yet: keep working on the task.\n"
           "- Everything is done: call complete_task with status: \"success\".\n"
           "- You are stuck on a real blocker: call complete_task with status: \"blocked\".\n"
           "- Only some parts are done: call complete_task with status: \"partial\".\n"
           "\n"
           "Do not call complete_task before the request is really complete.";
}

std::string partial_continuation_prompt(const std::string& remaining_work,
                                        const std::string& original_request,
                                        const std::string& completed_summary,
                                        const std::optional<std::string>& incomplete_todos) {
    std::ostringstream out;
    if (incomplete_todos.has_value()) {
        out << "Your complete_task call was rejected because these todo items are "
               "still open:\n\n"
            << incomplete_todos.value() << "\n\n"
            << "Finish any item that is not done yet. Then call todowrite to mark each "
               "item as \"completed\" or \"cancelled\", and call complete_task with "
               "status=\"success\" again.";
        return out.str();
    }

    out << "You called complete_task with status=\"partial\", so the task is not "
           "finished.\n\n"
        << "## Original Request\n\"" << original_request << "\"\n\n"
        << "## What You Completed\n" << completed_summary << "\n\n"
        << "## What You Said Remains\n" << remaining_work << "\n\n"
        << "## REQUIRED: Create a Continuation Plan\n\n"
        << "1. Re-read every requirement of the original request.\n"
        << "2. Write a todo list of what is done and what remains, with a way to "
           "verify each remaining step.\n"
        << "3. Work through the remaining steps.\n"
        << "4. Call complete_task with status=\"success\" only when every requirement "
           "is met.\n\n"
        << "Use \"partial\" again only for a real technical blocker, and prefer "
           "\"blocked\" for things like login walls, CAPTCHAs or rate limits. Do not ask "
           "the user whether to continue; continue.";
    return out.str();
}

}  // namespace taskwarden::completion
