#pragma once
// =============================================================================
// GovernanceConfig.hpp - typed configuration for the governance layer
// =============================================================================
// JSON document with three sections:
//
//   {
//     "prompt_security": { "patterns_file": "...", "enable_llm_guard": false, ... },
//     "hitl_controller": { "confidence_threshold": 0.85, "tier_1_actions": [...], ... },
//     "audit":           { "journal_dir": "audit", "queue_capacity": 4096 }
//   }
//
// Lookup when no path is given: $GOVERNANCE_CONFIG_PATH, ./governance.json,
// ../governance.json. Nothing found = defaults. Environment overrides apply
// after the file, then everything is validated once. A config that fails
// validation is never handed to the runtime.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "bastion/core/Result.hpp"
#include "bastion/oversight/OversightTier.hpp"

namespace bastion {

enum class SemanticFailurePolicy : uint8_t {
    FailOpen,     // classifier down -> Layer 1/2 verdict stands
    FailClosed    // classifier down -> unsafe
};

inline const char* failure_policy_str(SemanticFailurePolicy p) noexcept {
    return p == SemanticFailurePolicy::FailClosed ? "fail_closed" : "fail_open";
}

struct SecurityConfig {
    std::optional<std::filesystem::path> patterns_file;
    bool                  enable_llm_guard = false;
    std::size_t           max_input_length = 10240;       // bytes
    std::string           semantic_endpoint;
    uint32_t              semantic_timeout_ms = 500;
    SemanticFailurePolicy semantic_failure_policy = SemanticFailurePolicy::FailOpen;
    uint32_t              pattern_reload_interval_ms = 0;  // 0 = no watcher
};

struct OversightConfig {
    OversightTier         default_tier = OversightTier::TIER_3_LOW;
    double                confidence_threshold = 0.85;
    double                amount_threshold = 10000.0;
    std::set<std::string> tier_1_actions{
        "sar_filing", "payment_block", "account_close", "fraud_escalation"};
    std::set<std::string> tier_3_actions{
        "info_lookup", "status_lookup", "knowledge_search", "faq_response"};
    std::set<std::string> high_risk_dispute_types{
        "fraud", "identity_theft", "money_laundering", "account_takeover"};
    double                sample_rate_tier_2 = 0.10;
};

struct AuditConfig {
    std::filesystem::path journal_dir = "audit";
    std::size_t           queue_capacity = 4096;
};

struct GovernanceConfig {
    SecurityConfig  security;
    OversightConfig oversight;
    AuditConfig     audit;

    std::string     source = "defaults";   // file path the values came from

    // Search path, env overrides, validation.
    static Result<GovernanceConfig> load();
    // Explicit file, env overrides, validation.
    static Result<GovernanceConfig> loadFile(const std::filesystem::path& path);
    // Parse only; no env overrides, no validation.
    static Result<GovernanceConfig> fromJson(const nlohmann::json& doc);

    Status applyEnvOverrides();
    Status validate() const;

    nlohmann::json toJson() const;
    void dump() const;
};

} // namespace bastion
