// =============================================================================
// src/hitl_controller_test.cpp - decision audit cardinality, review workflow,
//                                durable escalation stats
// =============================================================================

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "bastion/audit/AuditSink.hpp"
#include "bastion/audit/JournalAuditStore.hpp"
#include "bastion/core/Uuid.hpp"
#include "bastion/oversight/ActionState.hpp"
#include "bastion/oversight/HitlController.hpp"

using namespace bastion;
namespace fs = std::filesystem;

class HitlControllerTest {
public:
    HitlControllerTest()
        : root_(fs::temp_directory_path() / ("bastion_hitl_" + newUuid())) {}

    ~HitlControllerTest() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    int run_all_tests() {
        std::cout << "\n=== BASTION HITL CONTROLLER - UNIT TESTS ===\n\n";

        test_one_row_per_decision();
        test_decision_row_contents();
        test_review_workflow();
        test_review_validation();
        test_pending_order();
        test_concurrent_reviewers();
        test_stats_survive_restart();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    fs::path root_;
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    // One journal + sink + controller, torn down in reverse.
    struct Rig {
        std::unique_ptr<JournalAuditStore> store;
        std::unique_ptr<AuditSink>         sink;
        std::unique_ptr<HitlController>    hitl;

        Rig(const fs::path& dir, OversightConfig cfg = OversightConfig{}) {
            store = std::move(JournalAuditStore::open(dir)).value();
            sink  = std::make_unique<AuditSink>(*store, 4096);
            sink->start();
            hitl  = std::make_unique<HitlController>(cfg, *store, *sink);
        }

        ~Rig() {
            hitl.reset();
            if (sink) sink->stop();
        }
    };

    void check(bool ok, const std::string& name, const std::string& reason = "") {
        if (ok) {
            std::cout << "  PASS " << name << "\n";
            tests_passed_++;
        } else {
            std::cout << "  FAIL " << name << " - " << reason << "\n";
            tests_failed_++;
        }
    }

    static std::vector<nlohmann::json> readRows(const fs::path& file) {
        std::vector<nlohmann::json> rows;
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) rows.push_back(nlohmann::json::parse(line));
        }
        return rows;
    }

    static OversightConfig alwaysSample() {
        OversightConfig cfg;
        cfg.sample_rate_tier_2 = 1.0;
        return cfg;
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_one_row_per_decision() {
        std::cout << "Testing Decision Audit Cardinality...\n";

        fs::path dir = root_ / "cardinality";
        Rig rig(dir);

        std::map<OversightTier, uint64_t> expected;
        int valid = 0;
        int rejected = 0;
        for (int i = 0; i < 300; ++i) {
            double confidence = (i % 10) / 10.0 + 0.05;        // 0.05 .. 0.95
            std::optional<double> amount;
            if (i % 4 == 0) amount = 500.0 * i;
            std::string dispute = (i % 7 == 0) ? "fraud" : "billing_error";
            std::optional<std::string> type;
            if (i % 11 == 0) type = "sar_filing";
            else if (i % 5 == 0) type = "info_lookup";

            auto r = rig.hitl->shouldInterrupt(confidence, amount, dispute, type);
            if (r.ok()) {
                ++valid;
                ++expected[r->tier];
            }

            if (i % 50 == 0) {
                auto bad = rig.hitl->shouldInterrupt(1.5);
                if (!bad.ok() && bad.error().code == ErrorCode::Validation) ++rejected;
            }
        }
        check(valid == 300, "All valid calls classified");
        check(rejected == 6, "Invalid calls rejected");

        check(rig.sink->flush(std::chrono::seconds(5)), "Audit queue drained");
        check(rig.sink->auditLoss() == 0, "No audit loss");

        auto rows = readRows(dir / "hitl_decisions.jsonl");
        check(rows.size() == 300, "Exactly one hitl_decisions row per valid call",
              std::to_string(rows.size()));

        auto stats = rig.hitl->getEscalationStats();
        check(stats.total == 300, "Stats total from store");
        check(stats.tier(OversightTier::TIER_1_HIGH).count == expected[OversightTier::TIER_1_HIGH]
              && stats.tier(OversightTier::TIER_2_MEDIUM).count == expected[OversightTier::TIER_2_MEDIUM]
              && stats.tier(OversightTier::TIER_3_LOW).count == expected[OversightTier::TIER_3_LOW],
              "Per-tier counts match");
        check(stats.tier(OversightTier::TIER_1_HIGH).interruptRate() == 1.0, "Tier 1 interrupt rate is 1");
        check(stats.tier(OversightTier::TIER_3_LOW).interrupts == 0, "Tier 3 never interrupts");

        auto j = HitlController::statsToJson(stats);
        check(j["total"] == 300 && j["tiers"].contains("tier_1") && j["tiers"]["tier_3"]["interrupts"] == 0,
              "Stats JSON view");

        std::cout << "\n";
    }

    void test_decision_row_contents() {
        std::cout << "Testing Decision Row Contents...\n";

        fs::path dir = root_ / "contents";
        Rig rig(dir);

        ActionDescriptor a;
        a.confidence = 0.72;
        a.amount = 15000.0;
        a.dispute_type = "fraud";
        a.session_id = "sess-42";
        a.agent_id = "resolution_agent";
        auto r = rig.hitl->shouldInterrupt(a);
        check(r.ok(), "Classified");
        rig.sink->flush(std::chrono::seconds(2));

        auto rows = readRows(dir / "hitl_decisions.jsonl");
        bool ok = rows.size() == 1;
        if (ok) {
            const auto& row = rows[0];
            ok = row["decision_id"] == r->decision_id
              && row["tier"] == "tier_2"
              && row["reason"] == r->reason
              && row["should_interrupt"] == r->should_interrupt
              && row["amount"] == 15000.0
              && row["dispute_type"] == "fraud"
              && row["action_type"].is_null()
              && row["session_id"] == "sess-42"
              && row["agent_id"] == "resolution_agent";
        }
        check(ok, "Row mirrors the decision and context");

        std::cout << "\n";
    }

    void test_review_workflow() {
        std::cout << "Testing Review Workflow...\n";

        Rig rig(root_ / "workflow");

        auto low = rig.hitl->shouldInterrupt(0.99, 5.0, "billing_error", std::string("info_lookup"));
        auto refused = rig.hitl->requestHumanReview(low.value(), {{"note", "x"}});
        check(!refused.ok() && refused.error().code == ErrorCode::Validation,
              "Review refused for non-interrupting decision");

        auto sar = rig.hitl->shouldInterrupt(0.99, 1.0, "billing_error", std::string("sar_filing"));
        check(sar.ok() && sar->should_interrupt, "SAR filing interrupts");

        nlohmann::json context = {{"customer_id", "C-991"}, {"summary", "structuring pattern"}};
        auto review_id = rig.hitl->requestHumanReview(sar.value(), context);
        check(review_id.ok(), "Review created");

        auto pending = rig.hitl->findReview(review_id.value());
        check(pending && pending->status == ReviewStatus::Pending
              && pending->decision_id == sar->decision_id
              && pending->context == context
              && pending->priority == ReviewPriority::High, "Pending, linked, context verbatim, high priority");
        check(actionState(sar.value(), pending) == ActionState::AwaitingReview, "Execution suspended");

        auto done = rig.hitl->recordHumanDecision(review_id.value(), true, "officer_1", std::string("filed"));
        check(done.ok() && done->status == ReviewStatus::Approved, "Approved");
        check(actionState(sar.value(), rig.hitl->findReview(review_id.value())) == ActionState::Approved,
              "State machine reaches APPROVED");

        auto again = rig.hitl->recordHumanDecision(review_id.value(), false, "officer_2");
        check(!again.ok() && again.error().code == ErrorCode::StateConflict, "Second decision rejected");
        auto unchanged = rig.hitl->findReview(review_id.value());
        check(unchanged && unchanged->status == ReviewStatus::Approved
              && unchanged->reviewer_id == std::string("officer_1"), "Record unchanged");

        auto unknown = rig.hitl->recordHumanDecision("missing-review", true, "officer_1");
        check(!unknown.ok() && unknown.error().code == ErrorCode::NotFound, "Unknown review is NotFound");

        std::cout << "\n";
    }

    void test_review_validation() {
        std::cout << "Testing Review Validation...\n";

        Rig rig(root_ / "review_validation");
        auto d = rig.hitl->shouldInterrupt(0.9, std::nullopt, "general", std::string("account_close"));
        auto id = rig.hitl->requestHumanReview(d.value(), nlohmann::json::object());

        auto anon = rig.hitl->recordHumanDecision(id.value(), true, "");
        check(!anon.ok() && anon.error().code == ErrorCode::Validation, "Empty reviewer rejected");
        check(rig.hitl->findReview(id.value())->status == ReviewStatus::Pending, "Review still pending");

        std::cout << "\n";
    }

    void test_pending_order() {
        std::cout << "Testing Pending Order...\n";

        Rig rig(root_ / "pending", alwaysSample());

        auto t2a = rig.hitl->shouldInterrupt(0.5);
        auto id_t2a = rig.hitl->requestHumanReview(t2a.value(), {{"n", 1}});
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

        auto t1 = rig.hitl->shouldInterrupt(0.99, std::nullopt, "general", std::string("payment_block"));
        auto id_t1 = rig.hitl->requestHumanReview(t1.value(), {{"n", 2}});
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

        auto t2b = rig.hitl->shouldInterrupt(0.6);
        auto id_t2b = rig.hitl->requestHumanReview(t2b.value(), {{"n", 3}});

        auto q = rig.hitl->pendingReviews();
        check(q.size() == 3, "Three pending");
        check(q.size() == 3 && q[0].review_id == id_t1.value()
              && q[1].review_id == id_t2a.value() && q[2].review_id == id_t2b.value(),
              "High priority first, then oldest first");

        (void)rig.hitl->recordHumanDecision(id_t1.value(), false, "officer_9");
        check(rig.hitl->pendingReviews().size() == 2, "Resolved review leaves the queue");

        std::cout << "\n";
    }

    void test_concurrent_reviewers() {
        std::cout << "Testing Concurrent Reviewers...\n";

        Rig rig(root_ / "concurrent");
        auto d = rig.hitl->shouldInterrupt(0.99, std::nullopt, "general", std::string("fraud_escalation"));
        auto id = rig.hitl->requestHumanReview(d.value(), nlohmann::json::object());

        std::atomic<int> wins{0};
        std::vector<std::thread> reviewers;
        for (int i = 0; i < 6; ++i) {
            reviewers.emplace_back([&, i]() {
                if (rig.hitl->recordHumanDecision(id.value(), true, "r" + std::to_string(i)).ok()) {
                    wins.fetch_add(1);
                }
            });
        }
        for (auto& t : reviewers) t.join();
        check(wins.load() == 1, "Only one reviewer's decision lands");

        std::cout << "\n";
    }

    void test_stats_survive_restart() {
        std::cout << "Testing Escalation Stats After Restart...\n";

        fs::path dir = root_ / "restart";
        EscalationStats before;
        {
            Rig rig(dir, alwaysSample());
            for (int i = 0; i < 10; ++i) (void)rig.hitl->shouldInterrupt(0.99);                 // tier 3
            for (int i = 0; i < 5; ++i)  (void)rig.hitl->shouldInterrupt(0.4);                  // tier 2, sampled
            for (int i = 0; i < 2; ++i) {
                (void)rig.hitl->shouldInterrupt(0.99, std::nullopt, "general", std::string("sar_filing"));
            }
            rig.sink->flush(std::chrono::seconds(2));
            before = rig.hitl->getEscalationStats();
        }

        Rig restarted(dir);
        auto after = restarted.hitl->getEscalationStats();
        check(before.total == 17 && after.total == 17, "Total survives restart", std::to_string(after.total));
        check(after.tier(OversightTier::TIER_2_MEDIUM).interrupts == 5
              && after.tier(OversightTier::TIER_1_HIGH).interrupts == 2
              && after.interrupts == 7, "Interrupt counts survive restart");
        check(std::abs(after.interruptRate() - 7.0 / 17.0) < 1e-12, "Interrupt rate from durable rows");

        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "=== SUMMARY: passed " << std::setw(3) << tests_passed_
                  << "  failed " << std::setw(3) << tests_failed_ << " ===\n";
        std::cout << (tests_failed_ == 0 ? "ALL TESTS PASSED\n\n" : "SOME TESTS FAILED\n\n");
    }
};

int main() {
    HitlControllerTest tester;
    return tester.run_all_tests();
}
