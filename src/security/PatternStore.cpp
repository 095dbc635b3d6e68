#include "bastion/security/PatternStore.hpp"
#include "bastion/security/ThreatType.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <unordered_set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bastion {

size_t PatternSnapshot::enabledCount() const {
    return static_cast<size_t>(std::count_if(
        patterns.begin(), patterns.end(),
        [](const CompiledPattern& p) { return p.def.enabled; }));
}

std::vector<DetectionPattern> PatternStore::defaultPatterns() {
    using namespace threat;
    return {
        // Direct instruction override
        {"io_ignore_previous",      kInstructionOverride, R"(ignore\s+(all\s+)?(previous\s+)?instructions?)", true},
        {"io_ignore_your",          kInstructionOverride, R"(ignore\s+(your|the)\s+instructions?)", true},
        {"io_disregard_prior",      kInstructionOverride, R"(disregard\s+(all\s+)?(prior\s+)?(instructions?|context|safety\s+guidelines?))", true},
        {"io_forget_everything",    kInstructionOverride, R"(forget\s+(everything|what)\s+(you|i)\s+(said|told))", true},
        {"io_override_programming", kInstructionOverride, R"(override\s+(your|the)\s+(programming|instructions?))", true},

        // Role hijacking
        {"rh_you_are_now",          kRoleHijack, R"(you\s+are\s+now\s+)", true},
        {"rh_act_as",               kRoleHijack, R"(\bact\s+as\s+(if\s+you\s+are\s+)?)", true},
        {"rh_pretend",              kRoleHijack, R"(pretend\s+(to\s+be|you('re|\s+are)))", true},
        {"rh_from_now_on",          kRoleHijack, R"(from\s+now\s+on\s+you('re|\s+are))", true},

        // System prompt extraction
        {"pl_show_prompt",          kPromptLeak, R"((show|reveal|print|output)\s+(me\s+)?(your|the)\s+(system\s+)?prompt)", true},
        {"pl_show_instructions",    kPromptLeak, R"((show|reveal|print|output)\s+(me\s+)?(your|the)\s+instructions?)", true},
        {"pl_what_are_instructions",kPromptLeak, R"(what\s+(are|is)\s+your\s+(instructions?|system\s+prompt))", true},
        {"pl_repeat_instructions",  kPromptLeak, R"(repeat\s+(back\s+)?(your|the)\s+instructions?)", true},

        // Delimiter injection
        {"di_fenced_system",        kDelimiterInjection, R"(```\s*system)", true},
        {"di_inst_tag",             kDelimiterInjection, R"(\[INST\])", true},
        {"di_im_start",             kDelimiterInjection, R"(<\|im_start\|>)", true},
        {"di_human_assistant",      kDelimiterInjection, R"(Human:[^\n]{0,500}?Assistant:)", true},

        // Jailbreak attempts
        {"jb_dan_mode",             kJailbreak, R"(\bDAN\s+mode)", true},
        {"jb_developer_mode",       kJailbreak, R"(developer\s+mode\s+(enabled|activated|for))", true},
        {"jb_no_guidelines",        kJailbreak, R"((no|without)\s+(ethical|safety)\s+(guidelines|restrictions))", true},
    };
}

Result<CompiledPattern> PatternStore::compile(const DetectionPattern& def) {
    if (def.id.empty()) {
        return makeError(ErrorCode::Validation, "pattern id is empty");
    }
    if (!isKnownThreatType(def.threat_type)) {
        return makeError(ErrorCode::Validation,
                         "pattern " + def.id + ": unknown threat_type '" + def.threat_type + "'");
    }
    if (def.pattern.empty()) {
        return makeError(ErrorCode::Validation, "pattern " + def.id + ": empty regex");
    }
    try {
        CompiledPattern cp;
        cp.def = def;
        cp.regex = std::regex(def.pattern,
                              std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
        if (std::regex_match(std::string(), cp.regex)) {
            return makeError(ErrorCode::Validation,
                             "pattern " + def.id + ": matches the empty string");
        }
        return cp;
    } catch (const std::regex_error& e) {
        return makeError(ErrorCode::Validation,
                         "pattern " + def.id + ": invalid regex (" + e.what() + ")");
    }
}

PatternStore::PatternStore() {
    std::lock_guard<std::mutex> lock(write_mu_);
    Status st = publish(assemble({}, false));
    if (!st.ok()) {
        // Built-in rules are compile-time constants; reaching this is a build defect.
        std::cerr << "[PATTERNS] Default rule set rejected: " << st.error().describe() << "\n";
    }
}

PatternStore::~PatternStore() {
    stopWatching();
}

std::shared_ptr<const PatternSnapshot> PatternStore::snapshot() const {
    return std::atomic_load(&current_);
}

std::optional<std::filesystem::path> PatternStore::patternsFile() const {
    std::lock_guard<std::mutex> lock(write_mu_);
    return file_;
}

std::vector<DetectionPattern> PatternStore::assemble(
    const std::vector<DetectionPattern>& file_defs,
    bool replaces_defaults) const {

    std::vector<DetectionPattern> defs;
    if (replaces_defaults) {
        defs = file_defs;
    } else {
        // Map-form file rules extend their own family: each family's file
        // rules follow its last built-in, families without built-ins go last.
        const auto builtins = defaultPatterns();
        std::vector<bool> placed(file_defs.size(), false);
        for (std::size_t i = 0; i < builtins.size(); ++i) {
            defs.push_back(builtins[i]);
            const bool family_ends = i + 1 == builtins.size()
                                  || builtins[i + 1].threat_type != builtins[i].threat_type;
            if (!family_ends) continue;
            for (std::size_t j = 0; j < file_defs.size(); ++j) {
                if (!placed[j] && file_defs[j].threat_type == builtins[i].threat_type) {
                    defs.push_back(file_defs[j]);
                    placed[j] = true;
                }
            }
        }
        for (std::size_t j = 0; j < file_defs.size(); ++j) {
            if (!placed[j]) defs.push_back(file_defs[j]);
        }
    }
    defs.insert(defs.end(), runtime_defs_.begin(), runtime_defs_.end());

    for (auto& d : defs) {
        auto it = enabled_overrides_.find(d.id);
        if (it != enabled_overrides_.end()) d.enabled = it->second;
    }
    return defs;
}

Status PatternStore::publish(std::vector<DetectionPattern> defs) {
    auto next = std::make_shared<PatternSnapshot>();
    next->patterns.reserve(defs.size());

    std::unordered_set<std::string> ids;
    for (auto& d : defs) {
        if (!ids.insert(d.id).second) {
            return makeError(ErrorCode::Configuration, "duplicate pattern id '" + d.id + "'");
        }
        auto compiled = compile(d);
        if (!compiled.ok()) {
            return makeError(ErrorCode::Configuration, compiled.error().message);
        }
        next->patterns.push_back(std::move(compiled).value());
    }

    auto prev = std::atomic_load(&current_);
    next->version = prev ? prev->version + 1 : 1;
    std::atomic_store(&current_, std::shared_ptr<const PatternSnapshot>(std::move(next)));
    return Status::success();
}

Result<PatternStore::ParsedFile> PatternStore::parseFile(
    const std::filesystem::path& path) const {

    std::ifstream in(path);
    if (!in.is_open()) {
        return makeError(ErrorCode::Configuration, "cannot open pattern file " + path.string());
    }

    // ordered_json keeps map-form families in file order
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(in);
    } catch (const json::exception& e) {
        return makeError(ErrorCode::Configuration,
                         "pattern file " + path.string() + " is not valid JSON: " + e.what());
    }

    ParsedFile out;
    auto& defs = out.defs;
    try {
        if (doc.is_object()) {
            for (const auto& [threat_type, list] : doc.items()) {
                if (!list.is_array()) {
                    return makeError(ErrorCode::Configuration,
                                     "pattern file: '" + threat_type + "' must map to an array");
                }
                int n = 0;
                for (const auto& p : list) {
                    DetectionPattern d;
                    d.id = threat_type + "_file_" + std::to_string(++n);
                    d.threat_type = threat_type;
                    d.pattern = p.get<std::string>();
                    defs.push_back(std::move(d));
                }
            }
        } else if (doc.is_array()) {
            // Array form is a full rule set; map form extends the built-ins.
            out.replaces_defaults = true;
            for (const auto& p : doc) {
                DetectionPattern d;
                d.id = p.at("id").get<std::string>();
                d.threat_type = p.at("threat_type").get<std::string>();
                d.pattern = p.at("pattern").get<std::string>();
                d.enabled = p.value("enabled", true);
                defs.push_back(std::move(d));
            }
        } else {
            return makeError(ErrorCode::Configuration,
                             "pattern file must be a JSON object or array");
        }
    } catch (const json::exception& e) {
        return makeError(ErrorCode::Configuration,
                         "pattern file " + path.string() + ": " + e.what());
    }
    return out;
}

Status PatternStore::load(const std::filesystem::path& path) {
    auto parsed = parseFile(path);
    if (!parsed.ok()) {
        std::cerr << "[PATTERNS] Load rejected, keeping v" << version()
                  << ": " << parsed.error().message << "\n";
        return parsed.error();
    }

    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);

    std::lock_guard<std::mutex> lock(write_mu_);
    Status st = publish(assemble(parsed->defs, parsed->replaces_defaults));
    if (!st.ok()) {
        std::cerr << "[PATTERNS] Load rejected, keeping v" << std::atomic_load(&current_)->version
                  << ": " << st.error().message << "\n";
        return st;
    }

    file_replaces_defaults_ = parsed->replaces_defaults;
    file_defs_ = std::move(parsed).value().defs;
    file_ = path;
    if (!ec) file_mtime_ = mtime;

    auto snap = std::atomic_load(&current_);
    std::cout << "[PATTERNS] Loaded " << path.string()
              << " version=" << snap->version
              << " patterns=" << snap->patterns.size()
              << " enabled=" << snap->enabledCount() << "\n";
    return Status::success();
}

Status PatternStore::reload() {
    auto path = patternsFile();
    if (!path) {
        return makeError(ErrorCode::Configuration, "no pattern file loaded");
    }
    return load(*path);
}

Result<std::string> PatternStore::addPattern(const std::string& pattern_text,
                                             const std::string& threat_type) {
    std::lock_guard<std::mutex> lock(write_mu_);

    DetectionPattern d;
    d.id = "runtime_" + std::to_string(next_runtime_id_);
    d.threat_type = threat_type;
    d.pattern = pattern_text;
    d.enabled = true;

    auto compiled = compile(d);
    if (!compiled.ok()) {
        return compiled.error();
    }

    runtime_defs_.push_back(d);
    Status st = publish(assemble(file_defs_, file_replaces_defaults_));
    if (!st.ok()) {
        runtime_defs_.pop_back();
        return makeError(ErrorCode::Validation, st.error().message);
    }
    ++next_runtime_id_;

    std::cout << "[PATTERNS] Added " << d.id << " threat_type=" << threat_type
              << " version=" << std::atomic_load(&current_)->version << "\n";
    return d.id;
}

Status PatternStore::setEnabled(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(write_mu_);

    const auto snap = std::atomic_load(&current_);
    const bool known = std::any_of(snap->patterns.begin(), snap->patterns.end(),
                                   [&id](const CompiledPattern& p) { return p.def.id == id; });
    if (!known) {
        return makeError(ErrorCode::NotFound, "no pattern with id '" + id + "'");
    }

    auto prev = enabled_overrides_.find(id);
    std::optional<bool> prev_value;
    if (prev != enabled_overrides_.end()) prev_value = prev->second;

    enabled_overrides_[id] = enabled;
    Status st = publish(assemble(file_defs_, file_replaces_defaults_));
    if (!st.ok()) {
        if (prev_value) enabled_overrides_[id] = *prev_value;
        else enabled_overrides_.erase(id);
        return st;
    }
    return Status::success();
}

void PatternStore::startWatching(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) return;
    if (watching_.exchange(true)) return;  // already running
    watch_interval_ = interval;
    watcher_ = std::thread([this]() { watchLoop(); });
}

void PatternStore::stopWatching() {
    bool was_watching = false;
    {
        std::lock_guard<std::mutex> lock(watch_mu_);
        was_watching = watching_.exchange(false);
    }
    if (!was_watching) return;
    watch_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
}

void PatternStore::watchLoop() {
    while (watching_.load()) {
        {
            std::unique_lock<std::mutex> lock(watch_mu_);
            watch_cv_.wait_for(lock, watch_interval_, [this]() { return !watching_.load(); });
        }
        if (!watching_.load()) break;

        std::optional<std::filesystem::path> path;
        std::optional<std::filesystem::file_time_type> seen;
        {
            std::lock_guard<std::mutex> lock(write_mu_);
            path = file_;
            seen = file_mtime_;
        }
        if (!path) continue;

        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(*path, ec);
        if (ec) {
            std::cerr << "[PATTERNS] Watch: cannot stat " << path->string()
                      << " (" << ec.message() << ")\n";
            continue;
        }
        if (seen && mtime == *seen) continue;

        Status st = load(*path);
        if (!st.ok()) {
            // Do not retry the same broken file every tick.
            std::lock_guard<std::mutex> lock(write_mu_);
            file_mtime_ = mtime;
        }
    }
}

} // namespace bastion
