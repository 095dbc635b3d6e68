#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "bastion/core/Clock.hpp"

namespace bastion {

enum class ReviewStatus : uint8_t {
    Pending,
    Approved,
    Rejected,
    Expired
};

inline const char* review_status_str(ReviewStatus s) noexcept {
    switch (s) {
        case ReviewStatus::Pending:  return "pending";
        case ReviewStatus::Approved: return "approved";
        case ReviewStatus::Rejected: return "rejected";
        case ReviewStatus::Expired:  return "expired";
        default: return "unknown";
    }
}

inline std::optional<ReviewStatus> parseReviewStatus(const std::string& s) {
    if (s == "pending")  return ReviewStatus::Pending;
    if (s == "approved") return ReviewStatus::Approved;
    if (s == "rejected") return ReviewStatus::Rejected;
    if (s == "expired")  return ReviewStatus::Expired;
    return std::nullopt;
}

enum class ReviewPriority : uint8_t {
    High,
    Normal,
    Low
};

inline const char* review_priority_str(ReviewPriority p) noexcept {
    switch (p) {
        case ReviewPriority::High:   return "high";
        case ReviewPriority::Normal: return "normal";
        case ReviewPriority::Low:    return "low";
        default: return "normal";
    }
}

inline ReviewPriority parseReviewPriority(const std::string& s) {
    if (s == "high") return ReviewPriority::High;
    if (s == "low")  return ReviewPriority::Low;
    return ReviewPriority::Normal;
}

struct ReviewRequest {
    std::string                review_id;
    std::string                decision_id;
    WallTime                   created_at;
    nlohmann::json             context;     // opaque, forwarded to the reviewer verbatim
    ReviewPriority             priority = ReviewPriority::Normal;

    std::optional<WallTime>    reviewed_at;
    std::optional<bool>        approved;
    std::optional<std::string> reviewer_id;
    std::optional<std::string> notes;

    ReviewStatus               status = ReviewStatus::Pending;
};

} // namespace bastion
