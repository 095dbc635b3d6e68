#pragma once

#include <string>

namespace bastion {

// Fixed taxonomy of prompt-injection threats (OWASP LLM Top 10 families).
// "custom" covers runtime patterns outside the families and Layer 3 verdicts
// that carry no family.
namespace threat {
inline constexpr const char* kInstructionOverride = "instruction_override";
inline constexpr const char* kRoleHijack          = "role_hijack";
inline constexpr const char* kPromptLeak          = "prompt_leak";
inline constexpr const char* kDelimiterInjection  = "delimiter_injection";
inline constexpr const char* kJailbreak           = "jailbreak";
inline constexpr const char* kCustom              = "custom";
} // namespace threat

inline bool isKnownThreatType(const std::string& t) {
    return t == threat::kInstructionOverride
        || t == threat::kRoleHijack
        || t == threat::kPromptLeak
        || t == threat::kDelimiterInjection
        || t == threat::kJailbreak
        || t == threat::kCustom;
}

} // namespace bastion
