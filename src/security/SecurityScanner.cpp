#include "bastion/security/SecurityScanner.hpp"
#include "bastion/security/ThreatType.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <regex>
#include <sstream>
#include <vector>

#include "bastion/core/Clock.hpp"
#include "bastion/core/Hash.hpp"
#include "bastion/core/Uuid.hpp"

namespace bastion {

namespace {

constexpr auto kReFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

// Role-override phrasing not already carried by the rule set.
// Bounded gaps keep backtracking depth small on 10 KiB inputs.
const std::vector<std::regex>& roleOverrideHeuristics() {
    static const std::vector<std::regex> rules = {
        std::regex(R"(from\s+now\s+on[^\n]{0,120}\byou('re|\s+are|\s+will\s+be)\b)", kReFlags),
        std::regex(R"(for\s+the\s+rest\s+of\s+(this|the|our)\s+(conversation|chat|session)[^\n]{0,120}\byou\b)", kReFlags),
        std::regex(R"(\bnew\s+(identity|persona|role)\b[^\n]{0,120}\byou\s+are\b)", kReFlags),
        std::regex(R"(\byour\s+new\s+(role|persona|name|identity)\s+is\b)", kReFlags),
    };
    return rules;
}

// Fabricated chat-role markers, special tokens, system-scoped fences.
const std::vector<std::regex>& delimiterHeuristics() {
    static const std::vector<std::regex> rules = {
        std::regex(R"(<\|[a-z_]{1,32}\|>)", kReFlags),
        std::regex(R"(\[/?INST\])", kReFlags),
        std::regex(R"(<<\s*/?SYS\s*>>)", kReFlags),
        std::regex(R"(###\s*(system|human|assistant|instruction)\b)", kReFlags),
        std::regex(R"(</?(system|user|assistant)>)", kReFlags),
        std::regex(R"(```\s*(system|instructions?)\b)", kReFlags),
        std::regex(R"((^|\n)[ \t]*(system|assistant)[ \t]*:)", kReFlags),
    };
    return rules;
}

// Trailing exfiltration clauses left behind once the trigger is removed.
const std::vector<std::regex>& exfilClauses() {
    static const std::vector<std::regex> rules = {
        std::regex(R"(\band\s+reveal\s+\w+)", kReFlags),
        std::regex(R"(\band\s+show\s+\w+)", kReFlags),
        std::regex(R"(\band\s+tell\s+me\s+\w+)", kReFlags),
    };
    return rules;
}

bool anySearch(const std::string& text, const std::vector<std::regex>& rules) {
    for (const auto& r : rules) {
        if (std::regex_search(text, r)) return true;
    }
    return false;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

bool isFiller(std::string word) {
    for (auto& c : word) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    static const char* filler[] = {"and", "the", "a", "an", "to", "for", "is", "are", "was", "were"};
    for (const char* f : filler) {
        if (word == f) return true;
    }
    return false;
}

std::size_t meaningfulChars(const std::string& residue) {
    std::istringstream words(residue);
    std::string w;
    std::size_t n = 0;
    while (words >> w) {
        if (!isFiller(w)) n += w.size();
    }
    return n;
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string formatScore(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

} // namespace

SecurityScanner::SecurityScanner(PatternStore& patterns,
                                 AuditSink& audit,
                                 SecurityConfig cfg,
                                 std::shared_ptr<SemanticClassifier> semantic)
    : patterns_(patterns)
    , audit_(audit)
    , cfg_(std::move(cfg))
    , semantic_(std::move(semantic)) {
    std::cout << "[SCANNER] Ready version=" << SCANNER_VERSION
              << " max_input=" << cfg_.max_input_length
              << " llm_guard=" << (cfg_.enable_llm_guard && semantic_ ? "on" : "off")
              << " policy=" << failure_policy_str(cfg_.semantic_failure_policy) << "\n";
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------
Result<ScanResult> SecurityScanner::scanInput(std::string_view text, const ScanContext& ctx) {
    if (text.size() > cfg_.max_input_length) {
        return makeError(ErrorCode::Validation,
                         "input length " + std::to_string(text.size()) +
                         " exceeds max_input_length " + std::to_string(cfg_.max_input_length));
    }

    const MonoTime t0 = monoNow();
    auto snap = patterns_.snapshot();

    ScanResult result = detect(text, *snap);
    result.scan_duration_ms = elapsedMs(t0);
    scans_.fetch_add(1);

    if (!result.is_safe) {
        recordThreat(*result.threat_type);
        std::cout << "[SCANNER] Blocked type=" << *result.threat_type
                  << " reason=" << result.reason
                  << " scan=" << ctx.scan_type;
        if (ctx.agent_id)   std::cout << " agent=" << *ctx.agent_id;
        if (ctx.session_id) std::cout << " session=" << *ctx.session_id;
        std::cout << "\n";
    }

    submitAudit(text, result, ctx);
    return result;
}

Result<ScanResult> SecurityScanner::scanPayload(const nlohmann::json& payload, const ScanContext& ctx) {
    if (!payload.is_string()) {
        return makeError(ErrorCode::Validation,
                         std::string("scan payload must be a string, got ") + payload.type_name());
    }
    return scanInput(payload.get_ref<const std::string&>(), ctx);
}

Result<ScanResult> SecurityScanner::scanAgentOutput(const std::string& agent_id,
                                                    std::string_view output,
                                                    ScanContext ctx) {
    if (agent_id.empty()) {
        return makeError(ErrorCode::Validation, "agent_id must not be empty");
    }
    ctx.agent_id  = agent_id;
    ctx.scan_type = "agent_output";
    return scanInput(output, ctx);
}

Result<std::string> SecurityScanner::addPattern(const std::string& pattern_text,
                                                const std::string& threat_type) {
    return patterns_.addPattern(pattern_text, threat_type);
}

// ---------------------------------------------------------------------------
// Layers
// ---------------------------------------------------------------------------
ScanResult SecurityScanner::detect(std::string_view text, const PatternSnapshot& snap) {
    ScanResult safe;
    safe.is_safe = true;
    safe.confidence = 1.0;
    safe.sanitized_input = std::string(text);
    safe.reason = "no_threat_detected";

    if (isBlank(text)) {
        safe.reason = "empty_input";
        return safe;
    }

    const std::string s(text);

    if (auto hit = patternLayer(s, snap)) {
        hit->sanitized_input = sanitizeWith(text, snap);
        return *hit;
    }
    if (auto hit = structuralLayer(s)) {
        hit->sanitized_input = sanitizeWith(text, snap);
        return *hit;
    }
    if (cfg_.enable_llm_guard && semantic_) {
        return semanticLayer(text, std::move(safe));
    }
    return safe;
}

std::optional<ScanResult> SecurityScanner::patternLayer(const std::string& text,
                                                        const PatternSnapshot& snap) const {
    for (const auto& p : snap.patterns) {
        if (!p.def.enabled) continue;
        if (!std::regex_search(text, p.regex)) continue;

        ScanResult r;
        r.is_safe = false;
        r.threat_type = p.def.threat_type;
        r.confidence = CONF_PATTERN;
        r.matched_patterns = {p.def.id};
        r.reason = "pattern:" + p.def.id;
        r.layer = ScanLayer::Pattern;
        return r;
    }
    return std::nullopt;
}

std::optional<ScanResult> SecurityScanner::structuralLayer(const std::string& text) const {
    ScanResult r;
    r.is_safe = false;
    r.layer = ScanLayer::Structural;

    if (anySearch(text, roleOverrideHeuristics())) {
        r.threat_type = threat::kRoleHijack;
        r.confidence = CONF_ROLE_OVERRIDE;
        r.matched_patterns = {"structural_role_override"};
        r.reason = "structural:role_override";
        return r;
    }
    if (anySearch(text, delimiterHeuristics())) {
        r.threat_type = threat::kDelimiterInjection;
        r.confidence = CONF_DELIMITER;
        r.matched_patterns = {"structural_delimiter"};
        r.reason = "structural:delimiter";
        return r;
    }
    return std::nullopt;
}

// Layer 1/2 found nothing; `clean` is the verdict to fall back on.
ScanResult SecurityScanner::semanticLayer(std::string_view text, ScanResult clean) {
    auto verdict = semantic_->classify(text, std::chrono::milliseconds(cfg_.semantic_timeout_ms));

    if (!verdict.ok()) {
        std::cerr << "[SEMANTIC] Classifier unavailable ("
                  << failure_policy_str(cfg_.semantic_failure_policy) << "): "
                  << verdict.error().message << "\n";

        if (cfg_.semantic_failure_policy == SemanticFailurePolicy::FailOpen) {
            clean.reason = "semantic_unavailable:fail_open";
            return clean;
        }

        ScanResult r;
        r.is_safe = false;
        r.threat_type = threat::kCustom;
        r.confidence = 1.0;
        r.sanitized_input = std::string();
        r.reason = "semantic_unavailable:fail_closed";
        r.layer = ScanLayer::Semantic;
        return r;
    }

    if (!verdict->malicious) return clean;

    const double score = std::clamp(verdict->score, 0.0, 1.0);

    ScanResult r;
    r.is_safe = false;
    r.threat_type = isKnownThreatType(verdict->category) ? verdict->category
                                                         : std::string(threat::kCustom);
    r.confidence = score;
    // whole input judged malicious, nothing to carve out
    r.sanitized_input = std::string();
    r.reason = "semantic:malicious(" + formatScore(score) + ")";
    r.layer = ScanLayer::Semantic;
    return r;
}

// ---------------------------------------------------------------------------
// Sanitizer
// ---------------------------------------------------------------------------
std::string SecurityScanner::sanitize(std::string_view text) const {
    auto snap = patterns_.snapshot();
    return sanitizeWith(text, *snap);
}

std::string SecurityScanner::sanitizeWith(std::string_view text, const PatternSnapshot& snap) const {
    std::string cur(text);

    bool triggered = anySearch(cur, roleOverrideHeuristics()) || anySearch(cur, delimiterHeuristics());
    for (const auto& p : snap.patterns) {
        if (triggered) break;
        triggered = p.def.enabled && std::regex_search(cur, p.regex);
    }
    if (!triggered) return cur;

    // Removing one match can expose another; iterate to a fixed point.
    for (;;) {
        std::string next = cur;
        for (const auto& p : snap.patterns) {
            if (p.def.enabled) next = std::regex_replace(next, p.regex, " ");
        }
        for (const auto& r : roleOverrideHeuristics()) next = std::regex_replace(next, r, " ");
        for (const auto& r : delimiterHeuristics())    next = std::regex_replace(next, r, " ");
        for (const auto& r : exfilClauses())           next = std::regex_replace(next, r, " ");
        next = collapseWhitespace(next);

        if (next == cur) break;
        cur = std::move(next);
    }

    if (meaningfulChars(cur) < 5) return std::string();
    return cur;
}

// ---------------------------------------------------------------------------
// Stats and audit
// ---------------------------------------------------------------------------
void SecurityScanner::recordThreat(const std::string& threat_type) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    ++threat_stats_[threat_type];
}

std::map<std::string, uint64_t> SecurityScanner::getThreatStats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return threat_stats_;
}

void SecurityScanner::submitAudit(std::string_view text, const ScanResult& result, const ScanContext& ctx) {
    SecurityEventRecord rec;
    rec.id               = newUuid();
    rec.timestamp        = wallNow();
    rec.input_hash       = sha256Hex(text);
    rec.input_length     = text.size();
    rec.is_safe          = result.is_safe;
    rec.threat_type      = result.threat_type;
    rec.confidence       = result.confidence;
    rec.matched_patterns = result.matched_patterns;
    rec.scan_duration_ms = result.scan_duration_ms;
    rec.session_id       = ctx.session_id;
    rec.user_id          = ctx.user_id;
    rec.agent_id         = ctx.agent_id;
    rec.scanner_version  = SCANNER_VERSION;
    rec.scan_type        = ctx.scan_type;

    audit_.submit(std::move(rec));
}

} // namespace bastion
