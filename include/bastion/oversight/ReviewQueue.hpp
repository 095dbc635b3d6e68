#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bastion/audit/AuditStore.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/oversight/InterruptDecision.hpp"
#include "bastion/oversight/ReviewRequest.hpp"

namespace bastion {

// Pending human reviews. Writes go straight to the AuditStore (not through
// the async sink): the caller must not suspend on a review that was never
// persisted, and a resolve must report the store's conditional-update result.
class ReviewQueue {
public:
    explicit ReviewQueue(AuditStore& store);

    // Only for decisions with should_interrupt set. Returns the new review_id.
    Result<std::string> requestHumanReview(const InterruptDecision& decision,
                                           nlohmann::json context);

    // pending -> approved | rejected, exactly once per review.
    // Unknown id: NotFound. Already resolved: StateConflict, record untouched.
    Result<ReviewRequest> recordHumanDecision(const std::string& review_id,
                                              bool approved,
                                              const std::string& reviewer_id,
                                              std::optional<std::string> notes = std::nullopt);

    std::optional<ReviewRequest> find(const std::string& review_id) const;

    // High priority first, then oldest first.
    std::vector<ReviewRequest> pending() const;

private:
    AuditStore& store_;
};

} // namespace bastion
