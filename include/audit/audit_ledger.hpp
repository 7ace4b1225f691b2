#pragma once

#include "audit/audit_entry.hpp"
#include "audit/audit_sink.hpp"
#include "core/error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace redactguard {

struct VerificationReport {
    bool ok = true;
    uint64_t entries_checked = 0;
    std::optional<uint64_t> broken_at;     // 1-based position of the first bad entry
    std::string reason;
};

/**
 * @brief Hash-chained, append-only audit ledger
 *
 * Producers call append(), which enqueues the entry for the single writer
 * thread and blocks until it is committed (or refused). The writer thread
 * assigns seq/prev_hash/curr_hash from the true tail, writes the line to
 * the sink and flushes before completing the future.
 *
 *   [append] --queue--> [Writer Thread] --> seq, prev_hash, curr_hash --> IAuditSink
 *
 * verify() replays what the sink actually stores. Any break puts the ledger
 * on integrity hold: further appends fail with CHAIN_INTEGRITY_ERROR until a
 * later verify() succeeds. The ledger verifies on construction and resumes
 * from the stored tail.
 */
class AuditLedger {
public:
    explicit AuditLedger(std::unique_ptr<IAuditSink> sink);
    ~AuditLedger();

    AuditLedger(const AuditLedger&) = delete;
    AuditLedger& operator=(const AuditLedger&) = delete;
    AuditLedger(AuditLedger&&) = delete;
    AuditLedger& operator=(AuditLedger&&) = delete;

    /**
     * @brief Commit an entry to the tail of the chain
     * @return The committed entry with seq and hashes filled in
     */
    [[nodiscard]] Result<AuditEntry> append(AuditEntry entry);

    [[nodiscard]] VerificationReport verify();

    /// Stop the writer thread after draining pending appends
    void shutdown();

    [[nodiscard]] std::vector<AuditEntry> entries() const;
    [[nodiscard]] std::vector<AuditEntry> find_by_operation(const std::string& operation_id) const;

    /// True when a SCRUB entry with outcome SUCCESS exists for the operation
    [[nodiscard]] bool has_committed_scrub(const std::string& operation_id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::string tail_hash() const;
    [[nodiscard]] bool on_hold() const { return hold_.load(std::memory_order_acquire); }
    [[nodiscard]] std::string sink_name() const;

private:
    struct Pending {
        AuditEntry entry;
        std::promise<Result<AuditEntry>> done;
    };

    void writer_thread_func();
    Result<AuditEntry> commit(AuditEntry entry);

    /// Replay stored lines; on success rebuilds entries_/by_operation_/tail_. Caller holds state_mutex_.
    VerificationReport verify_locked();

    std::unique_ptr<IAuditSink> sink_;

    // -- Chain state (guarded by state_mutex_) --
    mutable std::mutex state_mutex_;
    std::vector<AuditEntry> entries_;
    std::unordered_map<std::string, std::vector<size_t>> by_operation_;    // operation_id -> entries_ index
    std::string tail_hash_;
    uint64_t next_seq_ = 1;
    std::atomic<bool> hold_{false};

    // -- Writer thread --
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Pending> queue_;
    bool stopping_ = false;
    std::thread writer_thread_;
};

} // namespace redactguard
