#pragma once

#include <regex>
#include <string>

namespace bastion {

struct DetectionPattern {
    std::string id;
    std::string threat_type;
    std::string pattern;     // ECMAScript regex source
    bool        enabled = true;
};

// DetectionPattern plus its compiled form. Compiled once at publish time,
// never at scan time.
struct CompiledPattern {
    DetectionPattern def;
    std::regex       regex;
};

} // namespace bastion
