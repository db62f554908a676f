#include "completion/completion_state.hpp"

namespace taskwarden::completion {

using protocol::CompletionDeclaration;
using protocol::CompletionStatus;

std::string to_string(const CompletionFlowState state) {
    switch (state) {
        case CompletionFlowState::Idle:
            return "IDLE";
        case CompletionFlowState::Blocked:
            return "BLOCKED";
        case CompletionFlowState::PartialContinuationPending:
            return "PARTIAL_CONTINUATION_PENDING";
        case CompletionFlowState::ContinuationPending:
            return "CONTINUATION_PENDING";
        case CompletionFlowState::MaxRetriesReached:
            return "MAX_RETRIES_REACHED";
        case CompletionFlowState::Done:
            return "DONE";
        default:
            return "UNKNOWN";
    }
}

CompletionState::CompletionState(const std::uint32_t max_continuation_attempts)
    : max_continuation_attempts_(max_continuation_attempts) {}

bool CompletionState::is_terminal() const {
    return state_ == CompletionFlowState::Done ||
           state_ == CompletionFlowState::Blocked ||
           state_ == CompletionFlowState::MaxRetriesReached;
}

void CompletionState::record_declaration(const CompletionDeclaration& declaration,
                                         const bool downgraded_by_todos) {
    declaration_ = declaration;
    declaration_recorded_ = true;
    downgraded_by_todos_ = downgraded_by_todos;
    switch (declaration.status) {
        case CompletionStatus::Success:
            state_ = CompletionFlowState::Done;
            break;
        case CompletionStatus::Partial:
            state_ = CompletionFlowState::PartialContinuationPending;
            break;
        default:
            state_ = CompletionFlowState::Blocked;
            break;
    }
}

bool CompletionState::count_attempt() {
    ++continuation_attempts_;
    if (continuation_attempts_ > max_continuation_attempts_) {
        state_ = CompletionFlowState::MaxRetriesReached;
        return false;
    }
    return true;
}

bool CompletionState::schedule_continuation() {
    if (state_ != CompletionFlowState::Idle &&
        state_ != CompletionFlowState::ContinuationPending) {
        return false;
    }
    if (!count_attempt()) {
        return false;
    }
    state_ = CompletionFlowState::ContinuationPending;
    return true;
}

bool CompletionState::start_continuation() {
    if (state_ != CompletionFlowState::ContinuationPending) {
        return false;
    }
    state_ = CompletionFlowState::Idle;
    return true;
}

bool CompletionState::start_partial_continuation() {
    if (state_ != CompletionFlowState::PartialContinuationPending) {
        return false;
    }
    if (!count_attempt()) {
        return false;
    }
    state_ = CompletionFlowState::Idle;
    declaration_recorded_ = false;
    downgraded_by_todos_ = false;
    return true;
}

void CompletionState::reset() {
    state_ = CompletionFlowState::Idle;
    continuation_attempts_ = 0;
    declaration_.reset();
    declaration_recorded_ = false;
    downgraded_by_todos_ = false;
}

}  // namespace taskwarden::completion
