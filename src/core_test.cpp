// =============================================================================
// src/core_test.cpp - Result/Status, hashing, UUID and clock helpers
// =============================================================================

#include <iomanip>
#include <iostream>
#include <set>
#include <string>

#include "bastion/core/Clock.hpp"
#include "bastion/core/Hash.hpp"
#include "bastion/core/Result.hpp"
#include "bastion/core/Uuid.hpp"

using namespace bastion;

class CoreTest {
public:
    int run_all_tests() {
        std::cout << "\n=== BASTION CORE - UNIT TESTS ===\n\n";

        test_result_and_status();
        test_fnv1a64();
        test_sha256();
        test_uuid();
        test_iso8601();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
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

    static Result<int> parsePositive(int v) {
        if (v <= 0) return makeError(ErrorCode::Validation, "not positive");
        return v;
    }

    void test_result_and_status() {
        std::cout << "Testing Result / Status...\n";

        auto good = parsePositive(7);
        check(good.ok() && good.value() == 7, "Result carries value");

        auto bad = parsePositive(-1);
        check(!bad.ok() && bad.error().code == ErrorCode::Validation, "Result carries error");
        check(bad.error().describe() == "validation: not positive", "Error describe()",
              bad.error().describe());

        Status s = Status::success();
        check(s.ok(), "Status success");

        Status f = makeError(ErrorCode::StateConflict, "already approved");
        check(!f.ok() && f.error().code == ErrorCode::StateConflict, "Status error");

        std::cout << "\n";
    }

    void test_fnv1a64() {
        std::cout << "Testing FNV-1a...\n";

        check(fnv1a64("") == 14695981039346656037ULL, "Empty string = offset basis");
        check(fnv1a64("a") == 0xaf63dc4c8601ec8cULL, "Known vector 'a'");
        check(fnv1a64("decision-1") == fnv1a64("decision-1"), "Deterministic");
        check(fnv1a64("decision-1") != fnv1a64("decision-2"), "Distinguishes inputs");

        std::cout << "\n";
    }

    void test_sha256() {
        std::cout << "Testing SHA-256...\n";

        check(sha256Hex("") ==
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
              "Empty input digest", sha256Hex(""));
        check(sha256Hex("abc") ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
              "Known vector 'abc'", sha256Hex("abc"));
        check(sha256Hex("x").size() == 64, "64 hex chars");

        std::cout << "\n";
    }

    void test_uuid() {
        std::cout << "Testing UUID...\n";

        std::set<std::string> seen;
        bool well_formed = true;
        for (int i = 0; i < 1000; ++i) {
            std::string u = newUuid();
            if (u.size() != 36 || u[8] != '-' || u[13] != '-' || u[14] != '4'
                || u[18] != '-' || u[23] != '-') {
                well_formed = false;
            }
            seen.insert(u);
        }
        check(well_formed, "Canonical v4 form");
        check(seen.size() == 1000, "1000 distinct ids");

        std::cout << "\n";
    }

    void test_iso8601() {
        std::cout << "Testing ISO-8601...\n";

        check(toIso8601(from_ms(0)) == "1970-01-01T00:00:00.000Z", "Epoch",
              toIso8601(from_ms(0)));
        check(toIso8601(from_ms(1700000000123ULL)) == "2023-11-14T22:13:20.123Z", "Millis kept",
              toIso8601(from_ms(1700000000123ULL)));
        check(to_ms(from_ms(1700000000123ULL)) == 1700000000123ULL, "to_ms inverts from_ms");

        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "=== SUMMARY: passed " << std::setw(3) << tests_passed_
                  << "  failed " << std::setw(3) << tests_failed_ << " ===\n";
        std::cout << (tests_failed_ == 0 ? "ALL TESTS PASSED\n\n" : "SOME TESTS FAILED\n\n");
    }
};

int main() {
    CoreTest tester;
    return tester.run_all_tests();
}
