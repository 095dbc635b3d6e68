#pragma once

#include <atomic>
#include <memory>

#include "bastion/audit/AuditSink.hpp"
#include "bastion/audit/AuditStore.hpp"
#include "bastion/config/GovernanceConfig.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/oversight/HitlController.hpp"
#include "bastion/security/PatternStore.hpp"
#include "bastion/security/SecurityScanner.hpp"
#include "bastion/security/SemanticClassifier.hpp"

namespace bastion {

// Single owner of one governance instance. Everything the orchestration
// caller touches hangs off here; nothing is global.
//
// Member order is construction order: store, sink, patterns, scanner, hitl.
// Teardown runs the other way, after stop() has drained the audit queue.
class GovernanceContext {
public:
    // Validates cfg, opens the audit journal, loads patterns_file. Any failure
    // is returned and nothing is left running.
    static Result<std::unique_ptr<GovernanceContext>> create(GovernanceConfig cfg);

    // Same, with a caller-supplied store and Layer-3 classifier.
    static Result<std::unique_ptr<GovernanceContext>> create(GovernanceConfig cfg,
                                                             std::unique_ptr<AuditStore> store,
                                                             std::shared_ptr<SemanticClassifier> semantic);

    ~GovernanceContext();

    GovernanceContext(const GovernanceContext&) = delete;
    GovernanceContext& operator=(const GovernanceContext&) = delete;

    bool start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    SecurityScanner&         scanner() noexcept { return *scanner_; }
    HitlController&          hitl() noexcept { return *hitl_; }
    PatternStore&            patterns() noexcept { return patterns_; }
    AuditSink&               audit() noexcept { return sink_; }
    AuditStore&              store() noexcept { return *store_; }
    const GovernanceConfig&  config() const noexcept { return cfg_; }

private:
    GovernanceContext(GovernanceConfig cfg,
                      std::unique_ptr<AuditStore> store,
                      std::shared_ptr<SemanticClassifier> semantic);

    GovernanceConfig                  cfg_;
    std::unique_ptr<AuditStore>       store_;
    AuditSink                         sink_;
    PatternStore                      patterns_;
    std::unique_ptr<SecurityScanner>  scanner_;
    std::unique_ptr<HitlController>   hitl_;
    std::atomic<bool>                 running_{false};
};

} // namespace bastion
