#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bastion {

// Severity order: TIER_1_HIGH > TIER_2_MEDIUM > TIER_3_LOW.
// Underlying values are chosen so a larger value is more severe.
enum class OversightTier : uint8_t {
    TIER_3_LOW    = 1,   // logged only
    TIER_2_MEDIUM = 2,   // sample-based review
    TIER_1_HIGH   = 3    // full human approval
};

inline const char* tier_str(OversightTier t) noexcept {
    switch (t) {
        case OversightTier::TIER_1_HIGH:   return "tier_1";
        case OversightTier::TIER_2_MEDIUM: return "tier_2";
        case OversightTier::TIER_3_LOW:    return "tier_3";
        default: return "unknown";
    }
}

inline std::optional<OversightTier> parseTier(const std::string& s) {
    if (s == "tier_1") return OversightTier::TIER_1_HIGH;
    if (s == "tier_2") return OversightTier::TIER_2_MEDIUM;
    if (s == "tier_3") return OversightTier::TIER_3_LOW;
    return std::nullopt;
}

inline bool moreSevere(OversightTier a, OversightTier b) noexcept {
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
}

} // namespace bastion
