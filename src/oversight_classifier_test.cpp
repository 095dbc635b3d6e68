// =============================================================================
// src/oversight_classifier_test.cpp - tier precedence, validation, sampling
// =============================================================================

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bastion/core/Uuid.hpp"
#include "bastion/oversight/ActionState.hpp"
#include "bastion/oversight/OversightClassifier.hpp"

using namespace bastion;

class OversightClassifierTest {
public:
    OversightClassifierTest() : classifier_(OversightConfig{}) {}

    int run_all_tests() {
        std::cout << "\n=== BASTION OVERSIGHT CLASSIFIER - UNIT TESTS ===\n\n";

        test_tier1_overrides_everything();
        test_confidence_validation();
        test_amount_validation();
        test_tier3_scenario();
        test_tier2_scenario();
        test_tier1_scenario();
        test_thresholds_are_strict();
        test_single_tier2_triggers();
        test_sampling_deterministic();
        test_sampling_rate();
        test_get_tier();
        test_decision_identity();
        test_action_state();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    OversightClassifier classifier_;
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void check(bool ok, const std::string& name, const std::string& reason = "") {
        if (ok) {
            std::cout << "  PASS " << name << "\n";
            tests_passed_++;
        } else {
            std::cout << "  FAIL " << name << " - " << reason << "\n";
            tests_failed_++;
        }
    }

    static ActionDescriptor action(double confidence,
                                   std::optional<double> amount = std::nullopt,
                                   std::string dispute_type = "general",
                                   std::optional<std::string> action_type = std::nullopt) {
        ActionDescriptor a;
        a.confidence = confidence;
        a.amount = amount;
        a.dispute_type = std::move(dispute_type);
        a.action_type = std::move(action_type);
        return a;
    }

    static bool startsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    static bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_tier1_overrides_everything() {
        std::cout << "Testing Tier 1 Precedence...\n";

        const std::vector<double> confidences = {0.0, 0.01, 0.5, 0.85, 0.99, 1.0};
        const std::vector<std::optional<double>> amounts = {std::nullopt, 0.0, 1.0, 10000.0, 1e9};
        const std::vector<std::string> disputes = {"general", "fraud", "billing_error"};

        int checked = 0;
        bool all = true;
        for (const auto& type : classifier_.config().tier_1_actions) {
            for (double c : confidences) {
                for (const auto& amt : amounts) {
                    for (const auto& d : disputes) {
                        auto r = classifier_.evaluate(action(c, amt, d, type));
                        ++checked;
                        if (!r.ok() || r->tier != OversightTier::TIER_1_HIGH || !r->should_interrupt
                            || r->reason != "tier_1_action:" + type) {
                            all = false;
                        }
                    }
                }
            }
        }
        check(all, "Tier-1 actions always TIER_1 + interrupt (" + std::to_string(checked) + " cases)");

        std::cout << "\n";
    }

    void test_confidence_validation() {
        std::cout << "Testing Confidence Validation...\n";

        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        bool all_rejected = true;
        for (double c : {-0.01, -1.0, 1.0001, 2.0, nan, inf, -inf}) {
            auto r = classifier_.evaluate(action(c, std::nullopt, "general", std::string("sar_filing")));
            if (r.ok() || r.error().code != ErrorCode::Validation) all_rejected = false;
        }
        check(all_rejected, "Out-of-range confidence rejected before Tier-1 rule");

        bool all_accepted = true;
        for (int i = 0; i <= 100; ++i) {
            if (!classifier_.evaluate(action(i / 100.0)).ok()) all_accepted = false;
        }
        check(all_accepted, "Every confidence in [0,1] accepted");

        std::cout << "\n";
    }

    void test_amount_validation() {
        std::cout << "Testing Amount Validation...\n";

        auto neg = classifier_.evaluate(action(0.9, -5.0));
        check(!neg.ok() && neg.error().code == ErrorCode::Validation, "Negative amount rejected");

        auto nan = classifier_.evaluate(action(0.9, std::numeric_limits<double>::quiet_NaN()));
        check(!nan.ok(), "NaN amount rejected");

        auto zero = classifier_.evaluate(action(0.9, 0.0));
        check(zero.ok(), "Zero amount accepted");

        auto none = classifier_.evaluate(action(0.9));
        check(none.ok() && !none->amount, "Absent amount accepted");

        std::cout << "\n";
    }

    void test_tier3_scenario() {
        std::cout << "Testing Low-Risk Lookup...\n";

        auto r = classifier_.evaluate(action(0.99, 5.0, "billing_error", std::string("info_lookup")));
        check(r.ok() && r->tier == OversightTier::TIER_3_LOW && !r->should_interrupt, "TIER_3, no interrupt");
        check(r.ok() && r->reason == "tier_3:auto_proceed", "Tier 3 reason", r.ok() ? r->reason : "");

        std::cout << "\n";
    }

    void test_tier2_scenario() {
        std::cout << "Testing Low Confidence + High Amount + Fraud...\n";

        auto r = classifier_.evaluate(action(0.72, 15000.0, "fraud"));
        check(r.ok() && r->tier == OversightTier::TIER_2_MEDIUM, "TIER_2");

        const std::string reason = r.ok() ? r->reason : "";
        check(startsWith(reason, "low_confidence:0.72<0.85;high_amount:15000>10000;high_risk_dispute:fraud;"),
              "Reason lists every breached rule", reason);
        check(r.ok() && r->should_interrupt == classifier_.sampled(r->decision_id),
              "Interrupt decided by sampling");
        check(r.ok() && (r->should_interrupt ? endsWith(reason, ";sampled") : endsWith(reason, ";not_sampled")),
              "Reason records the sampling outcome", reason);

        std::cout << "\n";
    }

    void test_tier1_scenario() {
        std::cout << "Testing SAR Filing...\n";

        auto r = classifier_.evaluate(action(0.99, 1.0, "billing_error", std::string("sar_filing")));
        check(r.ok() && r->tier == OversightTier::TIER_1_HIGH && r->should_interrupt, "TIER_1 interrupt");
        check(r.ok() && r->reason == "tier_1_action:sar_filing", "Reason names the action");

        std::cout << "\n";
    }

    void test_thresholds_are_strict() {
        std::cout << "Testing Threshold Boundaries...\n";

        auto at_conf = classifier_.evaluate(action(0.85));
        check(at_conf.ok() && at_conf->tier == OversightTier::TIER_3_LOW, "confidence == threshold is not low");

        auto at_amt = classifier_.evaluate(action(0.9, 10000.0));
        check(at_amt.ok() && at_amt->tier == OversightTier::TIER_3_LOW, "amount == threshold is not high");

        auto over = classifier_.evaluate(action(0.9, 10000.01));
        check(over.ok() && over->tier == OversightTier::TIER_2_MEDIUM
              && startsWith(over->reason, "high_amount:10000.01>10000"), "Just over is high",
              over.ok() ? over->reason : "");

        std::cout << "\n";
    }

    void test_single_tier2_triggers() {
        std::cout << "Testing Individual Tier 2 Triggers...\n";

        auto low = classifier_.evaluate(action(0.5));
        check(low.ok() && startsWith(low->reason, "low_confidence:0.5<0.85;"), "Low confidence only",
              low.ok() ? low->reason : "");

        auto risky = classifier_.evaluate(action(0.95, std::nullopt, "identity_theft"));
        check(risky.ok() && risky->tier == OversightTier::TIER_2_MEDIUM
              && startsWith(risky->reason, "high_risk_dispute:identity_theft;"), "High-risk dispute only");

        auto tier3_action = classifier_.evaluate(action(0.5, std::nullopt, "general", std::string("faq_response")));
        check(tier3_action.ok() && tier3_action->tier == OversightTier::TIER_2_MEDIUM,
              "Tier-3 action still promoted by low confidence");

        std::cout << "\n";
    }

    void test_sampling_deterministic() {
        std::cout << "Testing Stable Sampling...\n";

        bool stable = true;
        for (int i = 0; i < 200; ++i) {
            std::string id = "decision-" + std::to_string(i);
            auto a = classifier_.evaluate(action(0.5), id);
            auto b = classifier_.evaluate(action(0.5), id);
            if (!a.ok() || !b.ok() || a->should_interrupt != b->should_interrupt
                || a->decision_id != id) {
                stable = false;
            }
        }
        check(stable, "Same decision_id samples the same way");

        std::cout << "\n";
    }

    void test_sampling_rate() {
        std::cout << "Testing Sampling Rate...\n";

        OversightConfig never_cfg;
        never_cfg.sample_rate_tier_2 = 0.0;
        OversightClassifier never(never_cfg);

        OversightConfig always_cfg;
        always_cfg.sample_rate_tier_2 = 1.0;
        OversightClassifier always(always_cfg);

        int never_hits = 0;
        int always_hits = 0;
        int default_hits = 0;
        const int n = 10000;
        for (int i = 0; i < n; ++i) {
            std::string id = newUuid();
            if (never.sampled(id)) ++never_hits;
            if (always.sampled(id)) ++always_hits;
            if (classifier_.sampled(id)) ++default_hits;
        }
        check(never_hits == 0, "Rate 0 never samples");
        check(always_hits == n, "Rate 1 always samples");
        check(default_hits > n * 0.08 && default_hits < n * 0.12, "Default 10% rate",
              std::to_string(default_hits));

        auto forced = always.evaluate(action(0.1));
        check(forced.ok() && forced->should_interrupt && endsWith(forced->reason, ";sampled"),
              "Sampled Tier 2 interrupts");

        auto skipped = never.evaluate(action(0.1));
        check(skipped.ok() && !skipped->should_interrupt && endsWith(skipped->reason, ";not_sampled"),
              "Unsampled Tier 2 auto-proceeds");

        std::cout << "\n";
    }

    void test_get_tier() {
        std::cout << "Testing getTier...\n";

        check(classifier_.getTier("general", std::string("sar_filing")) == OversightTier::TIER_1_HIGH,
              "Tier-1 action");
        check(classifier_.getTier("fraud", std::string("account_close")) == OversightTier::TIER_1_HIGH,
              "Tier-1 action beats dispute");
        check(classifier_.getTier("fraud", std::string("info_lookup")) == OversightTier::TIER_3_LOW,
              "Tier-3 action");
        check(classifier_.getTier("fraud", std::nullopt) == OversightTier::TIER_2_MEDIUM,
              "High-risk dispute");
        check(classifier_.getTier("billing_error", std::nullopt) == OversightTier::TIER_3_LOW,
              "Fallback to default_tier");

        OversightConfig cfg;
        cfg.default_tier = OversightTier::TIER_2_MEDIUM;
        OversightClassifier cautious(cfg);
        check(cautious.getTier("billing_error", std::string("refund")) == OversightTier::TIER_2_MEDIUM,
              "Configured default_tier");

        bool agrees = true;
        for (const auto& type : classifier_.config().tier_1_actions) {
            auto worst = classifier_.evaluate(action(0.0, 1e12, "fraud", type));
            if (!worst.ok() || worst->tier != classifier_.getTier("fraud", type)) agrees = false;
        }
        check(agrees, "getTier agrees with evaluate for Tier-1 actions");

        check(moreSevere(OversightTier::TIER_1_HIGH, OversightTier::TIER_2_MEDIUM)
              && moreSevere(OversightTier::TIER_2_MEDIUM, OversightTier::TIER_3_LOW), "Severity order");

        std::cout << "\n";
    }

    void test_decision_identity() {
        std::cout << "Testing Decision Identity...\n";

        std::set<std::string> ids;
        for (int i = 0; i < 500; ++i) {
            auto r = classifier_.evaluate(action(0.9));
            if (r.ok()) ids.insert(r->decision_id);
        }
        check(ids.size() == 500, "decision_id unique per evaluation");

        auto before = wallNow();
        auto r = classifier_.evaluate(action(0.9, 12.0, "billing_error"));
        check(r.ok() && r->timestamp >= before && r->dispute_type == "billing_error"
              && r->amount == 12.0 && r->confidence == 0.9, "Inputs and timestamp carried");

        std::cout << "\n";
    }

    void test_action_state() {
        std::cout << "Testing Action State Machine...\n";

        auto t3 = classifier_.evaluate(action(0.99, 5.0, "billing_error", std::string("info_lookup")));
        check(actionState(t3.value(), std::nullopt) == ActionState::AutoProceed, "Tier 3 auto-proceeds");

        auto t1 = classifier_.evaluate(action(0.99, 1.0, "general", std::string("payment_block")));
        check(actionState(t1.value(), std::nullopt) == ActionState::AwaitingReview, "Tier 1 awaits review");

        ReviewRequest review;
        review.decision_id = t1->decision_id;
        review.status = ReviewStatus::Pending;
        check(actionState(t1.value(), review) == ActionState::AwaitingReview
              && !mayExecute(actionState(t1.value(), review)), "Pending review holds execution");

        review.status = ReviewStatus::Approved;
        check(actionState(t1.value(), review) == ActionState::Approved
              && mayExecute(actionState(t1.value(), review)), "Approved may execute");

        review.status = ReviewStatus::Rejected;
        check(actionState(t1.value(), review) == ActionState::Rejected
              && !mayExecute(actionState(t1.value(), review)), "Rejected may not execute");

        review.status = ReviewStatus::Expired;
        check(actionState(t1.value(), review) == ActionState::Expired, "Expired");

        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "=== SUMMARY: passed " << std::setw(3) << tests_passed_
                  << "  failed " << std::setw(3) << tests_failed_ << " ===\n";
        std::cout << (tests_failed_ == 0 ? "ALL TESTS PASSED\n\n" : "SOME TESTS FAILED\n\n");
    }
};

int main() {
    OversightClassifierTest tester;
    return tester.run_all_tests();
}
