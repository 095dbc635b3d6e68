#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "bastion/config/GovernanceConfig.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/oversight/InterruptDecision.hpp"

namespace bastion {

// ---------------------------------------------------------------------------
// Tier assignment, first match wins:
//
//   1. action_type in tier_1_actions                   -> TIER_1, interrupt
//   2. confidence < threshold | amount > threshold
//      | dispute_type in high_risk_dispute_types       -> TIER_2, interrupt if sampled
//   3. otherwise                                       -> TIER_3, never interrupt
//
// Rule 1 ignores every other input. Sampling hashes decision_id, so the same
// decision always samples the same way.
// ---------------------------------------------------------------------------
class OversightClassifier {
public:
    static constexpr uint64_t SAMPLE_BUCKETS = 10000;

    explicit OversightClassifier(OversightConfig cfg);

    // Validation error when confidence is outside [0,1] or NaN, or amount is
    // negative or not finite. Mints a fresh decision_id.
    Result<InterruptDecision> evaluate(const ActionDescriptor& action) const;

    // Same, with a caller-chosen decision_id (re-evaluating a known decision).
    Result<InterruptDecision> evaluate(const ActionDescriptor& action, std::string decision_id) const;

    // Type-only lookup for advisory use: rules 1 and 3 plus the high-risk
    // dispute set; confidence and amount are unknown here.
    OversightTier getTier(const std::string& dispute_type,
                          const std::optional<std::string>& action_type) const;

    bool sampled(const std::string& decision_id) const noexcept;

    const OversightConfig& config() const noexcept { return cfg_; }

    static Status validate(const ActionDescriptor& action);

private:
    OversightConfig cfg_;
    uint64_t        sample_cutoff_;
};

} // namespace bastion
