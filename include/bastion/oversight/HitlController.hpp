#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bastion/audit/AuditRecords.hpp"
#include "bastion/audit/AuditSink.hpp"
#include "bastion/audit/AuditStore.hpp"
#include "bastion/config/GovernanceConfig.hpp"
#include "bastion/oversight/ActionState.hpp"
#include "bastion/oversight/OversightClassifier.hpp"
#include "bastion/oversight/ReviewQueue.hpp"

namespace bastion {

// =============================================================================
// HitlController - human-in-the-loop entry point for regulated actions
// =============================================================================
// Every successful evaluation submits exactly one hitl_decisions record to
// the AuditSink, whatever the tier. Rejected (invalid) calls produce no
// decision and no record.
//
// Callers must honour should_interrupt: request a review and hold the action
// until actionState() reports Approved or Rejected.
// =============================================================================
class HitlController {
public:
    HitlController(OversightConfig cfg, AuditStore& store, AuditSink& sink);

    HitlController(const HitlController&) = delete;
    HitlController& operator=(const HitlController&) = delete;

    Result<InterruptDecision> shouldInterrupt(const ActionDescriptor& action);

    Result<InterruptDecision> shouldInterrupt(double confidence,
                                              std::optional<double> amount = std::nullopt,
                                              const std::string& dispute_type = "general",
                                              const std::optional<std::string>& action_type = std::nullopt);

    OversightTier getTier(const std::string& dispute_type,
                          const std::optional<std::string>& action_type = std::nullopt) const;

    Result<std::string> requestHumanReview(const InterruptDecision& decision, nlohmann::json context);

    Result<ReviewRequest> recordHumanDecision(const std::string& review_id,
                                              bool approved,
                                              const std::string& reviewer_id,
                                              std::optional<std::string> notes = std::nullopt);

    std::optional<ReviewRequest> findReview(const std::string& review_id) const;
    std::vector<ReviewRequest> pendingReviews() const;

    // Read from the durable store, not from in-process counters.
    EscalationStats getEscalationStats() const;
    static nlohmann::json statsToJson(const EscalationStats& stats);

    uint64_t evaluations() const noexcept { return evaluations_.load(); }

    const OversightClassifier& classifier() const noexcept { return classifier_; }

private:
    void submitAudit(const InterruptDecision& d, const ActionDescriptor& action);

    OversightClassifier   classifier_;
    ReviewQueue           reviews_;
    AuditStore&           store_;
    AuditSink&            sink_;
    std::atomic<uint64_t> evaluations_{0};
};

} // namespace bastion
