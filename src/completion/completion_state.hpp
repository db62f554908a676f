#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/completion_contract.hpp"

namespace taskwarden::completion {

enum class CompletionFlowState {
    Idle,
    Blocked,
    PartialContinuationPending,
    ContinuationPending,
    MaxRetriesReached,
    Done
};

std::string to_string(CompletionFlowState state);

// The enforcer's flow state plus the continuation-attempt counter.
// Illegal transitions are refused with a false return, never thrown.
class CompletionState {
public:
    explicit CompletionState(std::uint32_t max_continuation_attempts = 10);

    CompletionFlowState state() const { return state_; }
    std::uint32_t continuation_attempts() const { return continuation_attempts_; }
    std::uint32_t max_continuation_attempts() const { return max_continuation_attempts_; }
    const std::optional<protocol::CompletionDeclaration>& declaration() const {
        return declaration_;
    }
    bool downgraded_by_todos() const { return downgraded_by_todos_; }

    // One declaration per window; a window reopens when a partial
    // continuation is dispatched.
    bool accepts_declaration() const { return !declaration_recorded_; }

    bool is_terminal() const;
    bool is_pending_continuation() const {
        return state_ == CompletionFlowState::ContinuationPending;
    }
    bool is_pending_partial_continuation() const {
        return state_ == CompletionFlowState::PartialContinuationPending;
    }

    void record_declaration(const protocol::CompletionDeclaration& declaration,
                            bool downgraded_by_todos);

    // Idle/ContinuationPending -> ContinuationPending, or MaxRetriesReached
    // once the counter passes the limit (returns false then).
    bool schedule_continuation();

    // ContinuationPending -> Idle.
    bool start_continuation();

    // PartialContinuationPending -> Idle, counting an attempt; false and
    // MaxRetriesReached once the limit is passed.
    bool start_partial_continuation();

    void reset();

private:
    bool count_attempt();

    CompletionFlowState state_ = CompletionFlowState::Idle;
    std::uint32_t continuation_attempts_ = 0;
    const std::uint32_t max_continuation_attempts_;
    std::optional<protocol::CompletionDeclaration> declaration_;
    bool declaration_recorded_ = false;
    bool downgraded_by_todos_ = false;
};

}  // namespace taskwarden::completion
