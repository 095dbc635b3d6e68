#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bastion/core/Clock.hpp"
#include "bastion/oversight/OversightTier.hpp"

namespace bastion {

// Projection of one scan. Raw input never leaves the scanner; only its hash.
struct SecurityEventRecord {
    std::string                id;
    WallTime                   timestamp;
    std::string                input_hash;      // sha256 hex
    std::size_t                input_length = 0; // bytes
    bool                       is_safe = true;
    std::optional<std::string> threat_type;
    double                     confidence = 1.0;
    std::vector<std::string>   matched_patterns;
    double                     scan_duration_ms = 0.0;
    std::optional<std::string> session_id;
    std::optional<std::string> user_id;
    std::optional<std::string> agent_id;
    std::string                scanner_version;
    std::string                scan_type;
};

// Projection of one oversight evaluation. Exactly one per evaluate call.
struct HitlDecisionRecord {
    std::string                id;
    std::string                decision_id;
    WallTime                   timestamp;
    bool                       should_interrupt = false;
    std::string                reason;
    OversightTier              tier = OversightTier::TIER_3_LOW;
    double                     confidence = 0.0;
    std::optional<double>      amount;
    std::string                dispute_type;
    std::optional<std::string> action_type;
    std::optional<std::string> session_id;
    std::optional<std::string> agent_id;
};

using AuditRecord = std::variant<SecurityEventRecord, HitlDecisionRecord>;

struct TierStats {
    uint64_t count = 0;
    uint64_t interrupts = 0;

    double interruptRate() const noexcept {
        return count == 0 ? 0.0 : static_cast<double>(interrupts) / static_cast<double>(count);
    }
};

// Aggregate over every committed hitl_decisions row.
struct EscalationStats {
    uint64_t                          total = 0;
    uint64_t                          interrupts = 0;
    std::map<OversightTier, TierStats> by_tier;

    double interruptRate() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(interrupts) / static_cast<double>(total);
    }

    void record(OversightTier tier, bool interrupted) {
        ++total;
        TierStats& t = by_tier[tier];
        ++t.count;
        if (interrupted) {
            ++interrupts;
            ++t.interrupts;
        }
    }

    TierStats tier(OversightTier t) const {
        auto it = by_tier.find(t);
        return it == by_tier.end() ? TierStats{} : it->second;
    }
};

} // namespace bastion
