#pragma once

#include <optional>
#include <string>

#include "bastion/core/Clock.hpp"
#include "bastion/oversight/OversightTier.hpp"

namespace bastion {

// Proposed agent action, as presented by the orchestration caller.
struct ActionDescriptor {
    double                     confidence = 0.0;
    std::optional<double>      amount;
    std::string                dispute_type = "general";
    std::optional<std::string> action_type;

    // Audit correlation only; never influences the tier.
    std::optional<std::string> session_id;
    std::optional<std::string> agent_id;
};

// Outcome of one evaluation. Built once by OversightClassifier, then only read.
struct InterruptDecision {
    bool                       should_interrupt = false;
    std::string                reason;
    OversightTier              tier = OversightTier::TIER_3_LOW;
    double                     confidence = 0.0;
    std::optional<double>      amount;
    std::string                dispute_type;
    std::optional<std::string> action_type;
    WallTime                   timestamp;
    std::string                decision_id;
};

} // namespace bastion
