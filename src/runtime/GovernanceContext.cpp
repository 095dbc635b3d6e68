#include "bastion/runtime/GovernanceContext.hpp"

#include <chrono>
#include <iostream>

#include "bastion/audit/JournalAuditStore.hpp"
#include "bastion/security/HttpSemanticClassifier.hpp"

namespace bastion {

GovernanceContext::GovernanceContext(GovernanceConfig cfg,
                                     std::unique_ptr<AuditStore> store,
                                     std::shared_ptr<SemanticClassifier> semantic)
    : cfg_(std::move(cfg))
    , store_(std::move(store))
    , sink_(*store_, cfg_.audit.queue_capacity) {
    scanner_ = std::make_unique<SecurityScanner>(patterns_, sink_, cfg_.security, std::move(semantic));
    hitl_    = std::make_unique<HitlController>(cfg_.oversight, *store_, sink_);
}

GovernanceContext::~GovernanceContext() {
    stop();
}

Result<std::unique_ptr<GovernanceContext>> GovernanceContext::create(GovernanceConfig cfg) {
    Status st = cfg.validate();
    if (!st.ok()) return st.error();

    auto store = JournalAuditStore::open(cfg.audit.journal_dir);
    if (!store.ok()) return store.error();

    std::shared_ptr<SemanticClassifier> semantic;
    if (cfg.security.enable_llm_guard) {
        semantic = std::make_shared<HttpSemanticClassifier>(cfg.security.semantic_endpoint);
    }

    return create(std::move(cfg), std::move(store).value(), std::move(semantic));
}

Result<std::unique_ptr<GovernanceContext>> GovernanceContext::create(GovernanceConfig cfg,
                                                                     std::unique_ptr<AuditStore> store,
                                                                     std::shared_ptr<SemanticClassifier> semantic) {
    Status st = cfg.validate();
    if (!st.ok()) return st.error();
    if (!store) {
        return makeError(ErrorCode::Configuration, "no audit store");
    }

    std::unique_ptr<GovernanceContext> ctx(
        new GovernanceContext(std::move(cfg), std::move(store), std::move(semantic)));

    if (ctx->cfg_.security.patterns_file) {
        Status loaded = ctx->patterns_.load(*ctx->cfg_.security.patterns_file);
        if (!loaded.ok()) {
            return makeError(ErrorCode::Configuration,
                             "patterns_file rejected at startup: " + loaded.error().message);
        }
    }

    ctx->cfg_.dump();
    return std::move(ctx);
}

bool GovernanceContext::start() {
    if (running_.load()) return true;

    if (!sink_.start()) {
        std::cerr << "[GOVERNANCE] Audit sink failed to start\n";
        return false;
    }
    if (cfg_.security.patterns_file && cfg_.security.pattern_reload_interval_ms > 0) {
        patterns_.startWatching(std::chrono::milliseconds(cfg_.security.pattern_reload_interval_ms));
    }

    running_.store(true);
    std::cout << "[GOVERNANCE] Started patterns=v" << patterns_.version()
              << " journal=" << cfg_.audit.journal_dir.string() << "\n";
    return true;
}

void GovernanceContext::stop() {
    if (!running_.exchange(false)) return;

    patterns_.stopWatching();
    sink_.stop();

    std::cout << "[GOVERNANCE] Stopped. scans=" << scanner_->scansTotal()
              << " decisions=" << hitl_->evaluations()
              << " audit_written=" << sink_.recordsWritten()
              << " audit_loss=" << sink_.auditLoss() << "\n";
}

} // namespace bastion
