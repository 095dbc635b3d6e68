#include "bastion/audit/JournalAuditStore.hpp"

#include <initializer_list>
#include <iostream>
#include <string>
#include <system_error>

#include "bastion/core/Uuid.hpp"

namespace bastion {

namespace {

const char* kSecurityEventsFile = "security_events.jsonl";
const char* kDecisionsFile      = "hitl_decisions.jsonl";
const char* kReviewsFile        = "hitl_reviews.jsonl";

template<typename T>
nlohmann::json optToJson(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::optional<std::string> optString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<WallTime> optTime(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return from_ms(it->get<uint64_t>());
}

} // namespace

// ---------------------------------------------------------------------------
// Row codecs
// ---------------------------------------------------------------------------
nlohmann::json JournalAuditStore::toJson(const SecurityEventRecord& rec) {
    return nlohmann::json{
        {"id",               rec.id.empty() ? newUuid() : rec.id},
        {"timestamp",        toIso8601(rec.timestamp)},
        {"timestamp_ms",     to_ms(rec.timestamp)},
        {"input_hash",       rec.input_hash},
        {"input_length",     rec.input_length},
        {"is_safe",          rec.is_safe},
        {"threat_type",      optToJson(rec.threat_type)},
        {"confidence",       rec.confidence},
        {"matched_patterns", rec.matched_patterns},
        {"scan_duration_ms", rec.scan_duration_ms},
        {"session_id",       optToJson(rec.session_id)},
        {"user_id",          optToJson(rec.user_id)},
        {"agent_id",         optToJson(rec.agent_id)},
        {"scanner_version",  rec.scanner_version},
        {"scan_type",        rec.scan_type}
    };
}

nlohmann::json JournalAuditStore::toJson(const HitlDecisionRecord& rec) {
    return nlohmann::json{
        {"id",               rec.id.empty() ? newUuid() : rec.id},
        {"decision_id",      rec.decision_id},
        {"timestamp",        toIso8601(rec.timestamp)},
        {"timestamp_ms",     to_ms(rec.timestamp)},
        {"should_interrupt", rec.should_interrupt},
        {"reason",           rec.reason},
        {"tier",             tier_str(rec.tier)},
        {"confidence",       rec.confidence},
        {"amount",           optToJson(rec.amount)},
        {"dispute_type",     rec.dispute_type},
        {"action_type",      optToJson(rec.action_type)},
        {"session_id",       optToJson(rec.session_id)},
        {"agent_id",         optToJson(rec.agent_id)}
    };
}

nlohmann::json JournalAuditStore::toJson(const ReviewRequest& review) {
    nlohmann::json j{
        {"id",             newUuid()},
        {"review_id",      review.review_id},
        {"decision_id",    review.decision_id},
        {"created_at",     toIso8601(review.created_at)},
        {"created_at_ms",  to_ms(review.created_at)},
        {"context",        review.context},
        {"priority",       review_priority_str(review.priority)},
        {"reviewed_at",    nullptr},
        {"reviewed_at_ms", nullptr},
        {"approved",       optToJson(review.approved)},
        {"reviewer_id",    optToJson(review.reviewer_id)},
        {"notes",          optToJson(review.notes)},
        {"status",         review_status_str(review.status)}
    };
    if (review.reviewed_at) {
        j["reviewed_at"]    = toIso8601(*review.reviewed_at);
        j["reviewed_at_ms"] = to_ms(*review.reviewed_at);
    }
    return j;
}

// Throws nlohmann::json::exception on a malformed row; nullopt on an unknown status.
std::optional<ReviewRequest> JournalAuditStore::reviewFromJson(const nlohmann::json& j) {
    ReviewRequest r;
    r.review_id   = j.at("review_id").get<std::string>();
    r.decision_id = j.at("decision_id").get<std::string>();
    r.created_at  = from_ms(j.at("created_at_ms").get<uint64_t>());
    r.context     = j.value("context", nlohmann::json::object());
    r.priority    = parseReviewPriority(j.value("priority", std::string("normal")));
    r.reviewed_at = optTime(j, "reviewed_at_ms");
    r.reviewer_id = optString(j, "reviewer_id");
    r.notes       = optString(j, "notes");

    auto approved = j.find("approved");
    if (approved != j.end() && !approved->is_null()) {
        r.approved = approved->get<bool>();
    }

    auto status = parseReviewStatus(j.at("status").get<std::string>());
    if (!status) return std::nullopt;
    r.status = *status;
    return r;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
JournalAuditStore::JournalAuditStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

JournalAuditStore::~JournalAuditStore() {
    std::lock_guard<std::mutex> lock(mu_);
    events_.flush();
    decisions_.flush();
    reviews_.flush();
}

Result<std::unique_ptr<JournalAuditStore>> JournalAuditStore::open(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return makeError(ErrorCode::TransientCollaborator,
                         "cannot create journal dir " + dir.string() + ": " + ec.message());
    }

    std::unique_ptr<JournalAuditStore> store(new JournalAuditStore(dir));
    store->replay();

    Status st = store->openFiles();
    if (!st.ok()) return st.error();

    EscalationStats stats = store->escalationStats();
    std::cout << "[AUDIT] Journal " << dir.string()
              << " replayed: decisions=" << stats.total
              << " reviews=" << store->reviews_by_id_.size()
              << " security_events=" << store->security_events_;
    if (store->skipped_rows_ > 0) {
        std::cout << " skipped=" << store->skipped_rows_;
    }
    std::cout << "\n";

    return std::move(store);
}

Status JournalAuditStore::openFiles() {
    // A torn tail has no newline; terminate it so the next row starts clean.
    for (const char* name : {kSecurityEventsFile, kDecisionsFile, kReviewsFile}) {
        std::ifstream tail(dir_ / name, std::ios::binary | std::ios::ate);
        if (!tail || tail.tellg() <= 0) continue;
        tail.seekg(-1, std::ios::end);
        char last = '\n';
        tail.get(last);
        tail.close();
        if (last != '\n') {
            std::ofstream fix(dir_ / name, std::ios::app);
            fix << '\n';
        }
    }

    events_.open(dir_ / kSecurityEventsFile, std::ios::app);
    decisions_.open(dir_ / kDecisionsFile, std::ios::app);
    reviews_.open(dir_ / kReviewsFile, std::ios::app);

    if (!events_ || !decisions_ || !reviews_) {
        return makeError(ErrorCode::TransientCollaborator,
                         "cannot open journal files under " + dir_.string());
    }
    return Status::success();
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------
void JournalAuditStore::replay() {
    replayFile(dir_ / kDecisionsFile,       &JournalAuditStore::applyDecisionRow);
    replayFile(dir_ / kReviewsFile,         &JournalAuditStore::applyReviewRow);
    replayFile(dir_ / kSecurityEventsFile,  &JournalAuditStore::applySecurityRow);
}

void JournalAuditStore::replayFile(const std::filesystem::path& path,
                                   bool (JournalAuditStore::*apply)(const nlohmann::json&)) {
    std::ifstream in(path);
    if (!in) return;   // first run

    std::string line;
    uint64_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        std::string problem;
        try {
            if (!(this->*apply)(nlohmann::json::parse(line))) problem = "unrecognised row";
        } catch (const nlohmann::json::exception& e) {
            problem = e.what();
        }
        if (!problem.empty()) {
            ++skipped_rows_;
            std::cerr << "[AUDIT] Skipping " << path.filename().string()
                      << ":" << line_no << " (" << problem << ")\n";
        }
    }
}

bool JournalAuditStore::applyDecisionRow(const nlohmann::json& row) {
    auto tier = parseTier(row.at("tier").get<std::string>());
    if (!tier) return false;
    stats_.record(*tier, row.at("should_interrupt").get<bool>());
    return true;
}

bool JournalAuditStore::applyReviewRow(const nlohmann::json& row) {
    auto r = reviewFromJson(row);
    if (!r) return false;
    std::string id = r->review_id;
    reviews_by_id_[id] = std::move(*r);
    return true;
}

bool JournalAuditStore::applySecurityRow(const nlohmann::json& row) {
    if (!row.is_object() || !row.contains("input_hash")) return false;
    ++security_events_;
    return true;
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------
Status JournalAuditStore::appendRow(std::ofstream& out, const nlohmann::json& row, const char* table) {
    std::string line;
    try {
        line = row.dump();
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorCode::TransientCollaborator,
                         std::string(table) + " row encode failed: " + e.what());
    }

    out << line << '\n';
    out.flush();
    if (!out) {
        out.clear();
        return makeError(ErrorCode::TransientCollaborator,
                         std::string(table) + " write failed under " + dir_.string());
    }
    return Status::success();
}

Status JournalAuditStore::appendSecurityEvent(const SecurityEventRecord& rec) {
    nlohmann::json row = toJson(rec);
    std::lock_guard<std::mutex> lock(mu_);
    Status st = appendRow(events_, row, "security_events");
    if (st.ok()) ++security_events_;
    return st;
}

Status JournalAuditStore::appendDecision(const HitlDecisionRecord& rec) {
    nlohmann::json row = toJson(rec);
    std::lock_guard<std::mutex> lock(mu_);
    Status st = appendRow(decisions_, row, "hitl_decisions");
    if (st.ok()) stats_.record(rec.tier, rec.should_interrupt);
    return st;
}

Status JournalAuditStore::insertReview(const ReviewRequest& review) {
    nlohmann::json row = toJson(review);
    std::lock_guard<std::mutex> lock(mu_);
    if (reviews_by_id_.count(review.review_id)) {
        return makeError(ErrorCode::StateConflict, "review " + review.review_id + " already exists");
    }
    Status st = appendRow(reviews_, row, "hitl_reviews");
    if (st.ok()) reviews_by_id_.emplace(review.review_id, review);
    return st;
}

Result<ReviewRequest> JournalAuditStore::resolveReview(const std::string& review_id,
                                                       bool approved,
                                                       const std::string& reviewer_id,
                                                       const std::optional<std::string>& notes,
                                                       WallTime reviewed_at) {
    std::lock_guard<std::mutex> lock(mu_);

    auto it = reviews_by_id_.find(review_id);
    if (it == reviews_by_id_.end()) {
        return makeError(ErrorCode::NotFound, "review " + review_id + " not found");
    }
    if (it->second.status != ReviewStatus::Pending) {
        return makeError(ErrorCode::StateConflict,
                         "review " + review_id + " already " + review_status_str(it->second.status));
    }

    ReviewRequest updated = it->second;
    updated.status      = approved ? ReviewStatus::Approved : ReviewStatus::Rejected;
    updated.approved    = approved;
    updated.reviewer_id = reviewer_id;
    updated.notes       = notes;
    updated.reviewed_at = reviewed_at;

    Status st = appendRow(reviews_, toJson(updated), "hitl_reviews");
    if (!st.ok()) return st.error();

    it->second = updated;
    return updated;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------
std::optional<ReviewRequest> JournalAuditStore::findReview(const std::string& review_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = reviews_by_id_.find(review_id);
    if (it == reviews_by_id_.end()) return std::nullopt;
    return it->second;
}

std::vector<ReviewRequest> JournalAuditStore::reviewsWithStatus(ReviewStatus status) const {
    std::vector<ReviewRequest> out;
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : reviews_by_id_) {
        if (kv.second.status == status) out.push_back(kv.second);
    }
    return out;
}

EscalationStats JournalAuditStore::escalationStats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
}

uint64_t JournalAuditStore::securityEventCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return security_events_;
}

uint64_t JournalAuditStore::skippedRows() const {
    std::lock_guard<std::mutex> lock(mu_);
    return skipped_rows_;
}

} // namespace bastion
