#pragma once

#include <cstdint>
#include <optional>

#include "bastion/oversight/InterruptDecision.hpp"
#include "bastion/oversight/ReviewRequest.hpp"

namespace bastion {

// Where a regulated action sits in the oversight lifecycle:
//
//   START -> should_interrupt -> TIER_1 -> AWAITING_REVIEW -> APPROVED | REJECTED -> COMPLETED
//                                TIER_2 -> sample -> AUTO_PROCEED | AWAITING_REVIEW -> ...
//                                TIER_3 -> AUTO_PROCEED -> COMPLETED
//
// AwaitingReview is the only state in which the caller must hold execution.
enum class ActionState : uint8_t {
    AutoProceed,
    AwaitingReview,
    Approved,
    Rejected,
    Expired
};

inline const char* action_state_str(ActionState s) noexcept {
    switch (s) {
        case ActionState::AutoProceed:    return "AUTO_PROCEED";
        case ActionState::AwaitingReview: return "AWAITING_REVIEW";
        case ActionState::Approved:       return "APPROVED";
        case ActionState::Rejected:       return "REJECTED";
        case ActionState::Expired:        return "EXPIRED";
        default: return "UNKNOWN";
    }
}

inline ActionState actionState(const InterruptDecision& decision,
                               const std::optional<ReviewRequest>& review) noexcept {
    if (!decision.should_interrupt) return ActionState::AutoProceed;
    if (!review) return ActionState::AwaitingReview;

    switch (review->status) {
        case ReviewStatus::Approved: return ActionState::Approved;
        case ReviewStatus::Rejected: return ActionState::Rejected;
        case ReviewStatus::Expired:  return ActionState::Expired;
        case ReviewStatus::Pending:
        default:                     return ActionState::AwaitingReview;
    }
}

// True once the action may run: auto-proceed or a human approved it.
inline bool mayExecute(ActionState s) noexcept {
    return s == ActionState::AutoProceed || s == ActionState::Approved;
}

} // namespace bastion
