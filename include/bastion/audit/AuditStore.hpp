#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bastion/audit/AuditRecords.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/oversight/ReviewRequest.hpp"

namespace bastion {

// Durable, append-only write contract for the three audit tables.
// Implementations must be safe for concurrent callers.
class AuditStore {
public:
    virtual ~AuditStore() = default;

    virtual Status appendSecurityEvent(const SecurityEventRecord& rec) = 0;
    virtual Status appendDecision(const HitlDecisionRecord& rec) = 0;

    virtual Status insertReview(const ReviewRequest& review) = 0;

    // Conditional update: succeeds only while the review is pending.
    // Unknown id -> NotFound, already resolved -> StateConflict.
    virtual Result<ReviewRequest> resolveReview(const std::string& review_id,
                                                bool approved,
                                                const std::string& reviewer_id,
                                                const std::optional<std::string>& notes,
                                                WallTime reviewed_at) = 0;

    virtual std::optional<ReviewRequest> findReview(const std::string& review_id) const = 0;
    virtual std::vector<ReviewRequest> reviewsWithStatus(ReviewStatus status) const = 0;

    virtual EscalationStats escalationStats() const = 0;
};

} // namespace bastion
