#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

#include "bastion/audit/AuditRecords.hpp"
#include "bastion/audit/AuditStore.hpp"

namespace bastion {

// =============================================================================
// AuditSink - fire-and-forget audit writer
// =============================================================================
// Hot-path callers submit() and return immediately. A single writer thread
// drains the bounded queue into the AuditStore.
//
//   - queue full:    oldest queued record dropped, audit_loss++
//   - store failure: record dropped, audit_loss++, logged
//   - stop():        drains what is queued, then joins
//
// Records submitted before start() wait in the queue. stop() on a sink that
// was never started discards them and counts each into audit_loss.
// =============================================================================
class AuditSink {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 4096;

    AuditSink(AuditStore& store, std::size_t capacity = DEFAULT_CAPACITY);
    ~AuditSink();

    AuditSink(const AuditSink&) = delete;
    AuditSink& operator=(const AuditSink&) = delete;

    bool start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    void submit(AuditRecord rec) noexcept;

    // Blocks until the queue is empty and no write is in flight, or timeout.
    bool flush(std::chrono::milliseconds timeout);

    uint64_t recordsWritten() const noexcept { return written_.load(); }
    uint64_t auditLoss() const noexcept { return loss_.load(); }
    std::size_t queueDepth() const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    void writerLoop();
    Status write(const AuditRecord& rec);
    void countLoss(const char* why);
    void discardUnstarted();

    AuditStore&      store_;
    std::size_t      capacity_;

    mutable std::mutex        mu_;
    std::condition_variable   work_cv_;
    std::condition_variable   idle_cv_;
    std::deque<AuditRecord>   queue_;
    bool                      in_flight_ = false;
    bool                      stopping_ = false;

    std::atomic<bool>     running_{false};
    std::thread           writer_;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> loss_{0};
};

} // namespace bastion
