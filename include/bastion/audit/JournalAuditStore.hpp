#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "bastion/audit/AuditStore.hpp"

namespace bastion {

// ---------------------------------------------------------------------------
// JSON-lines journal, one append-only file per table:
//
//   <dir>/security_events.jsonl
//   <dir>/hitl_decisions.jsonl
//   <dir>/hitl_reviews.jsonl
//
// Every row carries a fresh "id". A review state change is appended as a new
// row version; replay keeps the latest version per review_id. open() replays
// all three files so review state and escalation stats survive restart.
// A torn trailing line (crash mid-write) is skipped with a warning.
// ---------------------------------------------------------------------------
class JournalAuditStore final : public AuditStore {
public:
    static Result<std::unique_ptr<JournalAuditStore>> open(const std::filesystem::path& dir);

    ~JournalAuditStore() override;

    JournalAuditStore(const JournalAuditStore&) = delete;
    JournalAuditStore& operator=(const JournalAuditStore&) = delete;

    Status appendSecurityEvent(const SecurityEventRecord& rec) override;
    Status appendDecision(const HitlDecisionRecord& rec) override;
    Status insertReview(const ReviewRequest& review) override;

    Result<ReviewRequest> resolveReview(const std::string& review_id,
                                        bool approved,
                                        const std::string& reviewer_id,
                                        const std::optional<std::string>& notes,
                                        WallTime reviewed_at) override;

    std::optional<ReviewRequest> findReview(const std::string& review_id) const override;
    std::vector<ReviewRequest> reviewsWithStatus(ReviewStatus status) const override;
    EscalationStats escalationStats() const override;

    uint64_t securityEventCount() const;
    uint64_t skippedRows() const;
    const std::filesystem::path& dir() const noexcept { return dir_; }

    static nlohmann::json toJson(const SecurityEventRecord& rec);
    static nlohmann::json toJson(const HitlDecisionRecord& rec);
    static nlohmann::json toJson(const ReviewRequest& review);
    static std::optional<ReviewRequest> reviewFromJson(const nlohmann::json& j);

private:
    explicit JournalAuditStore(std::filesystem::path dir);

    Status openFiles();
    void replay();
    void replayFile(const std::filesystem::path& path,
                    bool (JournalAuditStore::*apply)(const nlohmann::json&));
    bool applyDecisionRow(const nlohmann::json& row);
    bool applyReviewRow(const nlohmann::json& row);
    bool applySecurityRow(const nlohmann::json& row);

    // caller holds mu_
    Status appendRow(std::ofstream& out, const nlohmann::json& row, const char* table);

    std::filesystem::path dir_;

    mutable std::mutex mu_;
    std::ofstream events_;
    std::ofstream decisions_;
    std::ofstream reviews_;

    std::unordered_map<std::string, ReviewRequest> reviews_by_id_;
    EscalationStats stats_;
    uint64_t security_events_ = 0;
    uint64_t skipped_rows_ = 0;
};

} // namespace bastion
