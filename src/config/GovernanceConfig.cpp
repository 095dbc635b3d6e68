#include "bastion/config/GovernanceConfig.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace bastion {

namespace {

Error configError(std::string msg) {
    return makeError(ErrorCode::Configuration, std::move(msg));
}

void warnUnknownKeys(const nlohmann::json& section, const char* name,
                     std::initializer_list<const char*> known) {
    for (auto it = section.begin(); it != section.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) { found = true; break; }
        }
        if (!found) {
            std::cerr << "[CONFIG] Ignoring unknown key " << name << "." << it.key() << "\n";
        }
    }
}

std::set<std::string> stringSet(const nlohmann::json& j) {
    std::set<std::string> out;
    for (const auto& v : j) out.insert(v.get<std::string>());
    return out;
}

// Counts and sizes: JSON integer >= 0 that fits T. value() would cast a
// negative number straight to a huge unsigned.
template<typename T>
void readCount(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];

    uint64_t n = 0;
    if (v.is_number_unsigned()) {
        n = v.get<uint64_t>();
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        n = static_cast<uint64_t>(v.get<int64_t>());
    } else {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer, got " + v.dump());
    }
    if (n > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument(std::string(key) + " out of range: " + v.dump());
    }
    out = static_cast<T>(n);
}

// Throws nlohmann::json::exception on a type mismatch; the caller converts.
void parseSecurity(const nlohmann::json& s, SecurityConfig& out) {
    warnUnknownKeys(s, "prompt_security", {
        "patterns_file", "enable_llm_guard", "max_input_length", "semantic_endpoint",
        "semantic_timeout_ms", "semantic_failure_policy", "pattern_reload_interval_ms"});

    if (s.contains("patterns_file") && !s["patterns_file"].is_null()) {
        std::string p = s["patterns_file"].get<std::string>();
        if (!p.empty()) out.patterns_file = p;
    }
    out.enable_llm_guard    = s.value("enable_llm_guard", out.enable_llm_guard);
    readCount(s, "max_input_length", out.max_input_length);
    out.semantic_endpoint   = s.value("semantic_endpoint", out.semantic_endpoint);
    readCount(s, "semantic_timeout_ms", out.semantic_timeout_ms);
    readCount(s, "pattern_reload_interval_ms", out.pattern_reload_interval_ms);

    if (s.contains("semantic_failure_policy")) {
        std::string p = s["semantic_failure_policy"].get<std::string>();
        if (p == "fail_open") {
            out.semantic_failure_policy = SemanticFailurePolicy::FailOpen;
        } else if (p == "fail_closed") {
            out.semantic_failure_policy = SemanticFailurePolicy::FailClosed;
        } else {
            throw std::invalid_argument("semantic_failure_policy must be fail_open or fail_closed, got " + p);
        }
    }
}

void parseOversight(const nlohmann::json& h, OversightConfig& out) {
    warnUnknownKeys(h, "hitl_controller", {
        "default_tier", "confidence_threshold", "amount_threshold", "tier_1_actions",
        "tier_3_actions", "high_risk_dispute_types", "sample_rate_tier_2"});

    if (h.contains("default_tier")) {
        std::string t = h["default_tier"].get<std::string>();
        auto tier = parseTier(t);
        if (!tier) throw std::invalid_argument("default_tier must be tier_1, tier_2 or tier_3, got " + t);
        out.default_tier = *tier;
    }
    out.confidence_threshold = h.value("confidence_threshold", out.confidence_threshold);
    out.amount_threshold     = h.value("amount_threshold", out.amount_threshold);
    out.sample_rate_tier_2   = h.value("sample_rate_tier_2", out.sample_rate_tier_2);

    if (h.contains("tier_1_actions"))          out.tier_1_actions = stringSet(h["tier_1_actions"]);
    if (h.contains("tier_3_actions"))          out.tier_3_actions = stringSet(h["tier_3_actions"]);
    if (h.contains("high_risk_dispute_types")) out.high_risk_dispute_types = stringSet(h["high_risk_dispute_types"]);
}

void parseAudit(const nlohmann::json& a, AuditConfig& out) {
    warnUnknownKeys(a, "audit", {"journal_dir", "queue_capacity"});

    if (a.contains("journal_dir")) out.journal_dir = a["journal_dir"].get<std::string>();
    readCount(a, "queue_capacity", out.queue_capacity);
}

std::optional<double> parseDouble(const char* s) {
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

std::optional<bool> parseBool(const std::string& s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on")  return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    return std::nullopt;
}

} // namespace

Result<GovernanceConfig> GovernanceConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return configError("config root must be a JSON object");
    }

    GovernanceConfig cfg;
    try {
        if (doc.contains("prompt_security")) parseSecurity(doc["prompt_security"], cfg.security);
        if (doc.contains("hitl_controller")) parseOversight(doc["hitl_controller"], cfg.oversight);
        if (doc.contains("audit"))           parseAudit(doc["audit"], cfg.audit);
    } catch (const nlohmann::json::exception& e) {
        return configError(e.what());
    } catch (const std::invalid_argument& e) {
        return configError(e.what());
    }
    return cfg;
}

Result<GovernanceConfig> GovernanceConfig::loadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return configError("cannot open config " + path.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        return configError(path.string() + ": " + e.what());
    }

    auto parsed = fromJson(doc);
    if (!parsed.ok()) {
        return configError(path.string() + ": " + parsed.error().message);
    }

    GovernanceConfig cfg = std::move(parsed).value();
    cfg.source = path.string();

    Status st = cfg.applyEnvOverrides();
    if (!st.ok()) return st.error();
    st = cfg.validate();
    if (!st.ok()) return st.error();

    std::cout << "[CONFIG] Loaded from: " << cfg.source << "\n";
    return cfg;
}

Result<GovernanceConfig> GovernanceConfig::load() {
    if (const char* env = std::getenv("GOVERNANCE_CONFIG_PATH")) {
        if (*env) return loadFile(env);
    }

    const std::vector<std::filesystem::path> paths = {
        "governance.json",
        "../governance.json"
    };
    for (const auto& p : paths) {
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) return loadFile(p);
    }

    std::cout << "[CONFIG] No governance.json found, using defaults\n";
    GovernanceConfig cfg;
    Status st = cfg.applyEnvOverrides();
    if (!st.ok()) return st.error();
    st = cfg.validate();
    if (!st.ok()) return st.error();
    return cfg;
}

Status GovernanceConfig::applyEnvOverrides() {
    if (const char* v = std::getenv("HITL_CONFIDENCE_THRESHOLD")) {
        auto d = parseDouble(v);
        if (!d) return configError(std::string("HITL_CONFIDENCE_THRESHOLD not a number: ") + v);
        oversight.confidence_threshold = *d;
    }
    if (const char* v = std::getenv("HITL_AMOUNT_THRESHOLD")) {
        auto d = parseDouble(v);
        if (!d) return configError(std::string("HITL_AMOUNT_THRESHOLD not a number: ") + v);
        oversight.amount_threshold = *d;
    }
    if (const char* v = std::getenv("PROMPT_SECURITY_ENABLE_LLM_GUARD")) {
        auto b = parseBool(v);
        if (!b) return configError(std::string("PROMPT_SECURITY_ENABLE_LLM_GUARD not a bool: ") + v);
        security.enable_llm_guard = *b;
    }
    if (const char* v = std::getenv("PROMPT_SECURITY_MAX_INPUT_LENGTH")) {
        auto d = parseDouble(v);
        if (!d || *d < 0 || std::floor(*d) != *d) {
            return configError(std::string("PROMPT_SECURITY_MAX_INPUT_LENGTH not a byte count: ") + v);
        }
        security.max_input_length = static_cast<std::size_t>(*d);
    }
    return Status::success();
}

Status GovernanceConfig::validate() const {
    const auto& o = oversight;
    if (!std::isfinite(o.confidence_threshold) || o.confidence_threshold < 0.0 || o.confidence_threshold > 1.0) {
        return configError("confidence_threshold must be in [0,1]");
    }
    if (!std::isfinite(o.amount_threshold) || o.amount_threshold < 0.0) {
        return configError("amount_threshold must be >= 0");
    }
    if (!std::isfinite(o.sample_rate_tier_2) || o.sample_rate_tier_2 < 0.0 || o.sample_rate_tier_2 > 1.0) {
        return configError("sample_rate_tier_2 must be in [0,1]");
    }
    for (const auto& a : o.tier_1_actions) {
        if (o.tier_3_actions.count(a)) {
            return configError("action " + a + " listed in both tier_1_actions and tier_3_actions");
        }
    }

    const auto& s = security;
    if (s.max_input_length == 0) {
        return configError("max_input_length must be > 0");
    }
    if (s.semantic_timeout_ms == 0) {
        return configError("semantic_timeout_ms must be > 0");
    }
    if (s.enable_llm_guard && s.semantic_endpoint.empty()) {
        return configError("enable_llm_guard requires semantic_endpoint");
    }

    if (audit.queue_capacity == 0) {
        return configError("audit.queue_capacity must be > 0");
    }
    if (audit.journal_dir.empty()) {
        return configError("audit.journal_dir must not be empty");
    }
    return Status::success();
}

nlohmann::json GovernanceConfig::toJson() const {
    return nlohmann::json{
        {"prompt_security", {
            {"patterns_file", security.patterns_file ? nlohmann::json(security.patterns_file->string())
                                                     : nlohmann::json(nullptr)},
            {"enable_llm_guard", security.enable_llm_guard},
            {"max_input_length", security.max_input_length},
            {"semantic_endpoint", security.semantic_endpoint},
            {"semantic_timeout_ms", security.semantic_timeout_ms},
            {"semantic_failure_policy", failure_policy_str(security.semantic_failure_policy)},
            {"pattern_reload_interval_ms", security.pattern_reload_interval_ms}
        }},
        {"hitl_controller", {
            {"default_tier", tier_str(oversight.default_tier)},
            {"confidence_threshold", oversight.confidence_threshold},
            {"amount_threshold", oversight.amount_threshold},
            {"tier_1_actions", oversight.tier_1_actions},
            {"tier_3_actions", oversight.tier_3_actions},
            {"high_risk_dispute_types", oversight.high_risk_dispute_types},
            {"sample_rate_tier_2", oversight.sample_rate_tier_2}
        }},
        {"audit", {
            {"journal_dir", audit.journal_dir.string()},
            {"queue_capacity", audit.queue_capacity}
        }}
    };
}

void GovernanceConfig::dump() const {
    std::cout << "[CONFIG] Effective configuration (" << source << "):\n"
              << toJson().dump(2) << "\n";
}

} // namespace bastion
