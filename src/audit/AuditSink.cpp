#include "bastion/audit/AuditSink.hpp"

#include <iostream>
#include <new>
#include <type_traits>
#include <utility>

namespace bastion {

AuditSink::AuditSink(AuditStore& store, std::size_t capacity)
    : store_(store)
    , capacity_(capacity == 0 ? DEFAULT_CAPACITY : capacity) {}

AuditSink::~AuditSink() {
    stop();
}

bool AuditSink::start() {
    if (running_.load()) return true;

    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = false;
    }
    running_.store(true);
    writer_ = std::thread(&AuditSink::writerLoop, this);

    std::cout << "[AUDIT] Sink started capacity=" << capacity_ << "\n";
    return true;
}

void AuditSink::stop() {
    if (!running_.load()) {
        discardUnstarted();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    work_cv_.notify_all();

    if (writer_.joinable()) {
        writer_.join();
    }
    running_.store(false);

    std::cout << "[AUDIT] Sink stopped. written=" << written_.load()
              << " audit_loss=" << loss_.load() << "\n";
}

void AuditSink::submit(AuditRecord rec) noexcept {
    bool dropped = false;
    try {
        std::lock_guard<std::mutex> lock(mu_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(std::move(rec));
    } catch (const std::bad_alloc&) {
        dropped = true;
    }
    if (dropped) countLoss("queue full, dropped oldest");
    work_cv_.notify_one();
}

bool AuditSink::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!running_.load()) return queue_.empty() && !in_flight_;
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !in_flight_;
    });
}

std::size_t AuditSink::queueDepth() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void AuditSink::writerLoop() {
    std::unique_lock<std::mutex> lock(mu_);
    for (;;) {
        work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) break;   // stopping and drained

        AuditRecord rec = std::move(queue_.front());
        queue_.pop_front();
        in_flight_ = true;
        lock.unlock();

        Status st = write(rec);
        if (st.ok()) {
            written_.fetch_add(1);
        } else {
            countLoss(st.error().message.c_str());
        }

        lock.lock();
        in_flight_ = false;
        if (queue_.empty()) idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

Status AuditSink::write(const AuditRecord& rec) {
    return std::visit([this](const auto& r) -> Status {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, SecurityEventRecord>) {
            return store_.appendSecurityEvent(r);
        } else {
            return store_.appendDecision(r);
        }
    }, rec);
}

// Never started: nothing will drain the queue, so what is left is lost.
void AuditSink::discardUnstarted() {
    std::size_t left = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        left = queue_.size();
        queue_.clear();
    }
    if (left == 0) return;

    loss_.fetch_add(left);
    std::cerr << "[AUDIT] Sink stopped before start, discarded=" << left
              << " audit_loss=" << loss_.load() << "\n";
}

void AuditSink::countLoss(const char* why) {
    uint64_t n = loss_.fetch_add(1) + 1;
    // first loss, then every 1000th
    if (n == 1 || n % 1000 == 0) {
        std::cerr << "[AUDIT] Record lost (audit_loss=" << n << "): " << why << "\n";
    }
}

} // namespace bastion
