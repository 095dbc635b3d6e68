#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bastion/audit/AuditSink.hpp"
#include "bastion/config/GovernanceConfig.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/security/PatternStore.hpp"
#include "bastion/security/ScanResult.hpp"
#include "bastion/security/SemanticClassifier.hpp"

namespace bastion {

// =============================================================================
// SecurityScanner - layered prompt-injection classification
// =============================================================================
//   Layer 1  enabled DetectionPatterns in snapshot order, first hit wins
//   Layer 2  structural heuristics: role override, then delimiter injection
//   Layer 3  external semantic classifier, only when enabled and 1/2 are clean
//
// Each scan pins one PatternSnapshot for its whole run, so a concurrent
// addPattern or reload is either fully visible or not at all. The audit
// record is handed to the AuditSink; the scan never waits on storage.
// =============================================================================
class SecurityScanner {
public:
    static constexpr const char* SCANNER_VERSION = "1.0.0";

    static constexpr double CONF_PATTERN       = 0.95;
    static constexpr double CONF_ROLE_OVERRIDE = 0.85;
    static constexpr double CONF_DELIMITER     = 0.90;

    SecurityScanner(PatternStore& patterns,
                    AuditSink& audit,
                    SecurityConfig cfg,
                    std::shared_ptr<SemanticClassifier> semantic = nullptr);

    SecurityScanner(const SecurityScanner&) = delete;
    SecurityScanner& operator=(const SecurityScanner&) = delete;

    // Validation error when text exceeds max_input_length bytes.
    Result<ScanResult> scanInput(std::string_view text, const ScanContext& ctx = {});

    // Entry point for untyped payloads; anything but a JSON string is a Validation error.
    Result<ScanResult> scanPayload(const nlohmann::json& payload, const ScanContext& ctx = {});

    // Same pipeline for text one agent hands to another.
    Result<ScanResult> scanAgentOutput(const std::string& agent_id,
                                       std::string_view output,
                                       ScanContext ctx = {});

    // Strips every triggered substring. Unchanged when nothing matches,
    // "" when nothing meaningful survives. sanitize(sanitize(x)) == sanitize(x).
    std::string sanitize(std::string_view text) const;

    Result<std::string> addPattern(const std::string& pattern_text, const std::string& threat_type);

    std::map<std::string, uint64_t> getThreatStats() const;
    uint64_t scansTotal() const noexcept { return scans_.load(); }

    const SecurityConfig& config() const noexcept { return cfg_; }

private:
    ScanResult detect(std::string_view text, const PatternSnapshot& snap);
    std::optional<ScanResult> patternLayer(const std::string& text, const PatternSnapshot& snap) const;
    std::optional<ScanResult> structuralLayer(const std::string& text) const;
    ScanResult semanticLayer(std::string_view text, ScanResult clean);

    std::string sanitizeWith(std::string_view text, const PatternSnapshot& snap) const;

    void recordThreat(const std::string& threat_type);
    void submitAudit(std::string_view text, const ScanResult& result, const ScanContext& ctx);

    PatternStore&                       patterns_;
    AuditSink&                          audit_;
    SecurityConfig                      cfg_;
    std::shared_ptr<SemanticClassifier> semantic_;

    mutable std::mutex               stats_mu_;
    std::map<std::string, uint64_t>  threat_stats_;
    std::atomic<uint64_t>            scans_{0};
};

} // namespace bastion
