#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bastion {

// Which detection layer produced the verdict.
enum class ScanLayer : uint8_t {
    None,
    Pattern,
    Structural,
    Semantic
};

inline const char* scan_layer_str(ScanLayer l) noexcept {
    switch (l) {
        case ScanLayer::None:       return "none";
        case ScanLayer::Pattern:    return "pattern";
        case ScanLayer::Structural: return "structural";
        case ScanLayer::Semantic:   return "semantic";
        default: return "unknown";
    }
}

// Invariant: is_safe == !threat_type.has_value().
struct ScanResult {
    bool                       is_safe = true;
    std::optional<std::string> threat_type;
    double                     confidence = 1.0;
    std::vector<std::string>   matched_patterns;
    std::optional<std::string> sanitized_input;
    double                     scan_duration_ms = 0.0;

    std::string                reason;
    ScanLayer                  layer = ScanLayer::None;
};

// Correlation fields copied into the security_events row.
struct ScanContext {
    std::optional<std::string> session_id;
    std::optional<std::string> user_id;
    std::optional<std::string> agent_id;
    std::string                scan_type = "input";
};

} // namespace bastion
