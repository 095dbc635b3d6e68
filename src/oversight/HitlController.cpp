#include "bastion/oversight/HitlController.hpp"

#include <iostream>

#include "bastion/core/Uuid.hpp"

namespace bastion {

HitlController::HitlController(OversightConfig cfg, AuditStore& store, AuditSink& sink)
    : classifier_(std::move(cfg))
    , reviews_(store)
    , store_(store)
    , sink_(sink) {
    const auto& c = classifier_.config();
    std::cout << "[HITL] Ready confidence_threshold=" << c.confidence_threshold
              << " amount_threshold=" << c.amount_threshold
              << " sample_rate_tier_2=" << c.sample_rate_tier_2
              << " tier_1_actions=" << c.tier_1_actions.size() << "\n";
}

Result<InterruptDecision> HitlController::shouldInterrupt(const ActionDescriptor& action) {
    auto decision = classifier_.evaluate(action);
    if (!decision.ok()) {
        std::cerr << "[HITL] Rejected evaluation: " << decision.error().message << "\n";
        return decision;
    }

    evaluations_.fetch_add(1);
    submitAudit(*decision, action);

    if (decision->should_interrupt) {
        std::cout << "[HITL] INTERRUPT " << tier_str(decision->tier)
                  << " decision=" << decision->decision_id
                  << " reason=" << decision->reason << "\n";
    }
    return decision;
}

Result<InterruptDecision> HitlController::shouldInterrupt(double confidence,
                                                          std::optional<double> amount,
                                                          const std::string& dispute_type,
                                                          const std::optional<std::string>& action_type) {
    ActionDescriptor action;
    action.confidence   = confidence;
    action.amount       = amount;
    action.dispute_type = dispute_type;
    action.action_type  = action_type;
    return shouldInterrupt(action);
}

OversightTier HitlController::getTier(const std::string& dispute_type,
                                      const std::optional<std::string>& action_type) const {
    return classifier_.getTier(dispute_type, action_type);
}

Result<std::string> HitlController::requestHumanReview(const InterruptDecision& decision,
                                                       nlohmann::json context) {
    return reviews_.requestHumanReview(decision, std::move(context));
}

Result<ReviewRequest> HitlController::recordHumanDecision(const std::string& review_id,
                                                          bool approved,
                                                          const std::string& reviewer_id,
                                                          std::optional<std::string> notes) {
    return reviews_.recordHumanDecision(review_id, approved, reviewer_id, std::move(notes));
}

std::optional<ReviewRequest> HitlController::findReview(const std::string& review_id) const {
    return reviews_.find(review_id);
}

std::vector<ReviewRequest> HitlController::pendingReviews() const {
    return reviews_.pending();
}

EscalationStats HitlController::getEscalationStats() const {
    return store_.escalationStats();
}

nlohmann::json HitlController::statsToJson(const EscalationStats& stats) {
    nlohmann::json tiers = nlohmann::json::object();
    for (auto t : {OversightTier::TIER_1_HIGH, OversightTier::TIER_2_MEDIUM, OversightTier::TIER_3_LOW}) {
        TierStats ts = stats.tier(t);
        tiers[tier_str(t)] = {
            {"count", ts.count},
            {"interrupts", ts.interrupts},
            {"interrupt_rate", ts.interruptRate()}
        };
    }
    return nlohmann::json{
        {"total", stats.total},
        {"interrupts", stats.interrupts},
        {"interrupt_rate", stats.interruptRate()},
        {"tiers", tiers}
    };
}

void HitlController::submitAudit(const InterruptDecision& d, const ActionDescriptor& action) {
    HitlDecisionRecord rec;
    rec.id               = newUuid();
    rec.decision_id      = d.decision_id;
    rec.timestamp        = d.timestamp;
    rec.should_interrupt = d.should_interrupt;
    rec.reason           = d.reason;
    rec.tier             = d.tier;
    rec.confidence       = d.confidence;
    rec.amount           = d.amount;
    rec.dispute_type     = d.dispute_type;
    rec.action_type      = d.action_type;
    rec.session_id       = action.session_id;
    rec.agent_id         = action.agent_id;

    sink_.submit(std::move(rec));
}

} // namespace bastion
