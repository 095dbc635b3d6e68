#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bastion/core/Result.hpp"
#include "bastion/security/DetectionPattern.hpp"

namespace bastion {

// Immutable view of the rule set. Scans hold one for their whole duration.
struct PatternSnapshot {
    uint64_t                     version = 0;
    std::vector<CompiledPattern> patterns;   // insertion order = evaluation order

    size_t enabledCount() const;
};

// ---------------------------------------------------------------------------
// Owns the detection rules.
//
// Readers call snapshot() and get a complete, consistent rule list. Writers
// (addPattern, setEnabled, load/reload) build a new list off to the side,
// compile and validate every entry, then publish with an atomic pointer swap.
// A writer that fails validation publishes nothing: the previous snapshot
// stays live (last known good).
//
// Pattern file formats (JSON):
//   { "role_hijack": ["regex", ...], ... }        extends the defaults; each
//                                                  family's rules follow its built-ins
//   [ {"id": ..., "threat_type": ..., "pattern": ..., "enabled": true}, ... ]
//                                                  replaces the file-sourced set
// ---------------------------------------------------------------------------
class PatternStore {
public:
    PatternStore();
    ~PatternStore();

    PatternStore(const PatternStore&) = delete;
    PatternStore& operator=(const PatternStore&) = delete;

    std::shared_ptr<const PatternSnapshot> snapshot() const;

    Status load(const std::filesystem::path& path);
    Status reload();

    Result<std::string> addPattern(const std::string& pattern_text,
                                   const std::string& threat_type);
    Status setEnabled(const std::string& id, bool enabled);

    // Poll the loaded file's mtime and reload on change. No-op without a file.
    void startWatching(std::chrono::milliseconds interval);
    void stopWatching();

    uint64_t version() const { return snapshot()->version; }
    std::optional<std::filesystem::path> patternsFile() const;

    static std::vector<DetectionPattern> defaultPatterns();

    // Compiles a single definition; Validation error on bad regex or threat type.
    static Result<CompiledPattern> compile(const DetectionPattern& def);

private:
    struct ParsedFile {
        std::vector<DetectionPattern> defs;
        bool replaces_defaults = false;
    };

    Result<ParsedFile> parseFile(const std::filesystem::path& path) const;
    Status publish(std::vector<DetectionPattern> defs);   // caller holds write_mu_
    std::vector<DetectionPattern> assemble(const std::vector<DetectionPattern>& file_defs,
                                           bool replaces_defaults) const;
    void   watchLoop();

    std::shared_ptr<const PatternSnapshot> current_;   // atomic_load / atomic_store only

    mutable std::mutex                    write_mu_;
    std::vector<DetectionPattern>         runtime_defs_;   // added via addPattern
    std::unordered_map<std::string, bool> enabled_overrides_;
    std::vector<DetectionPattern>         file_defs_;      // from the pattern file
    bool                                  file_replaces_defaults_ = false;
    std::optional<std::filesystem::path>  file_;
    std::optional<std::filesystem::file_time_type> file_mtime_;
    uint64_t                              next_runtime_id_ = 1;

    std::chrono::milliseconds watch_interval_{0};
    std::atomic<bool>         watching_{false};
    std::mutex                watch_mu_;
    std::condition_variable   watch_cv_;
    std::thread               watcher_;
};

} // namespace bastion
