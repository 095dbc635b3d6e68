#include "bastion/oversight/ReviewQueue.hpp"

#include <algorithm>
#include <iostream>

#include "bastion/core/Uuid.hpp"

namespace bastion {

ReviewQueue::ReviewQueue(AuditStore& store)
    : store_(store) {}

Result<std::string> ReviewQueue::requestHumanReview(const InterruptDecision& decision,
                                                    nlohmann::json context) {
    if (!decision.should_interrupt) {
        return makeError(ErrorCode::Validation,
                         "decision " + decision.decision_id + " does not require review");
    }
    if (decision.decision_id.empty()) {
        return makeError(ErrorCode::Validation, "decision has no decision_id");
    }

    ReviewRequest review;
    review.review_id   = newUuid();
    review.decision_id = decision.decision_id;
    review.created_at  = wallNow();
    review.context     = std::move(context);
    review.priority    = decision.tier == OversightTier::TIER_1_HIGH ? ReviewPriority::High
                                                                     : ReviewPriority::Normal;
    review.status      = ReviewStatus::Pending;

    Status st = store_.insertReview(review);
    if (!st.ok()) {
        std::cerr << "[REVIEW] Persist failed decision=" << decision.decision_id
                  << ": " << st.error().describe() << "\n";
        return st.error();
    }

    std::cout << "[REVIEW] Pending review=" << review.review_id
              << " decision=" << review.decision_id
              << " priority=" << review_priority_str(review.priority) << "\n";
    return review.review_id;
}

Result<ReviewRequest> ReviewQueue::recordHumanDecision(const std::string& review_id,
                                                       bool approved,
                                                       const std::string& reviewer_id,
                                                       std::optional<std::string> notes) {
    if (reviewer_id.empty()) {
        return makeError(ErrorCode::Validation, "reviewer_id must not be empty");
    }

    auto resolved = store_.resolveReview(review_id, approved, reviewer_id, notes, wallNow());
    if (!resolved.ok()) {
        std::cerr << "[REVIEW] Resolve rejected review=" << review_id
                  << ": " << resolved.error().describe() << "\n";
        return resolved.error();
    }

    std::cout << "[REVIEW] " << (approved ? "APPROVED" : "REJECTED")
              << " review=" << review_id << " by=" << reviewer_id << "\n";
    return resolved;
}

std::optional<ReviewRequest> ReviewQueue::find(const std::string& review_id) const {
    return store_.findReview(review_id);
}

std::vector<ReviewRequest> ReviewQueue::pending() const {
    auto out = store_.reviewsWithStatus(ReviewStatus::Pending);
    std::sort(out.begin(), out.end(), [](const ReviewRequest& a, const ReviewRequest& b) {
        if (a.priority != b.priority) return a.priority < b.priority;   // High sorts first
        return a.created_at < b.created_at;
    });
    return out;
}

} // namespace bastion
