#include "bastion/oversight/OversightClassifier.hpp"

#include <cmath>
#include <cstdio>
#include <vector>

#include "bastion/core/Hash.hpp"
#include "bastion/core/Uuid.hpp"

namespace bastion {

namespace {

// 0.72 -> "0.72", 15000 -> "15000", 0.8500 -> "0.85"
std::string fmtNum(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    std::string s(buf);
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    return s;
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out.push_back(sep);
        out += p;
    }
    return out;
}

} // namespace

OversightClassifier::OversightClassifier(OversightConfig cfg)
    : cfg_(std::move(cfg))
    , sample_cutoff_(static_cast<uint64_t>(
          std::llround(cfg_.sample_rate_tier_2 * static_cast<double>(SAMPLE_BUCKETS)))) {}

Status OversightClassifier::validate(const ActionDescriptor& action) {
    if (std::isnan(action.confidence) || action.confidence < 0.0 || action.confidence > 1.0) {
        return makeError(ErrorCode::Validation,
                         "confidence must be in [0.0, 1.0], got " + fmtNum(action.confidence));
    }
    if (action.amount && (!std::isfinite(*action.amount) || *action.amount < 0.0)) {
        return makeError(ErrorCode::Validation,
                         "amount must be finite and >= 0, got " + fmtNum(*action.amount));
    }
    return Status::success();
}

Result<InterruptDecision> OversightClassifier::evaluate(const ActionDescriptor& action) const {
    return evaluate(action, newUuid());
}

Result<InterruptDecision> OversightClassifier::evaluate(const ActionDescriptor& action,
                                                        std::string decision_id) const {
    Status st = validate(action);
    if (!st.ok()) return st.error();

    InterruptDecision d;
    d.confidence   = action.confidence;
    d.amount       = action.amount;
    d.dispute_type = action.dispute_type;
    d.action_type  = action.action_type;
    d.timestamp    = wallNow();
    d.decision_id  = std::move(decision_id);

    // 1. regulatory hard rule
    if (action.action_type && cfg_.tier_1_actions.count(*action.action_type)) {
        d.tier = OversightTier::TIER_1_HIGH;
        d.should_interrupt = true;
        d.reason = "tier_1_action:" + *action.action_type;
        return d;
    }

    // 2. risk signals
    std::vector<std::string> triggers;
    if (action.confidence < cfg_.confidence_threshold) {
        triggers.push_back("low_confidence:" + fmtNum(action.confidence) + "<" +
                           fmtNum(cfg_.confidence_threshold));
    }
    if (action.amount && *action.amount > cfg_.amount_threshold) {
        triggers.push_back("high_amount:" + fmtNum(*action.amount) + ">" +
                           fmtNum(cfg_.amount_threshold));
    }
    if (cfg_.high_risk_dispute_types.count(action.dispute_type)) {
        triggers.push_back("high_risk_dispute:" + action.dispute_type);
    }

    if (!triggers.empty()) {
        d.tier = OversightTier::TIER_2_MEDIUM;
        d.should_interrupt = sampled(d.decision_id);
        triggers.push_back(d.should_interrupt ? "sampled" : "not_sampled");
        d.reason = join(triggers, ';');
        return d;
    }

    // 3. low risk
    d.tier = OversightTier::TIER_3_LOW;
    d.should_interrupt = false;
    d.reason = "tier_3:auto_proceed";
    return d;
}

OversightTier OversightClassifier::getTier(const std::string& dispute_type,
                                           const std::optional<std::string>& action_type) const {
    if (action_type && cfg_.tier_1_actions.count(*action_type)) return OversightTier::TIER_1_HIGH;
    if (action_type && cfg_.tier_3_actions.count(*action_type)) return OversightTier::TIER_3_LOW;
    if (cfg_.high_risk_dispute_types.count(dispute_type))        return OversightTier::TIER_2_MEDIUM;
    return cfg_.default_tier;
}

bool OversightClassifier::sampled(const std::string& decision_id) const noexcept {
    return fnv1a64(decision_id) % SAMPLE_BUCKETS < sample_cutoff_;
}

} // namespace bastion
