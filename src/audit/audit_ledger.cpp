#include "audit/audit_ledger.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace redactguard {

AuditLedger::AuditLedger(std::unique_ptr<IAuditSink> sink)
    : sink_(std::move(sink)),
      tail_hash_(digest::kGenesisHash) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const auto report = verify_locked();
        if (report.ok) {
            utils::log::info(std::format("Audit ledger {} opened: {} entries, chain intact",
                sink_->name(), report.entries_checked));
        }
    }
    writer_thread_ = std::thread(&AuditLedger::writer_thread_func, this);
}

AuditLedger::~AuditLedger() {
    shutdown();
}

Result<AuditEntry> AuditLedger::append(AuditEntry entry) {
    if (hold_.load(std::memory_order_acquire)) {
        return Result<AuditEntry>::error(ErrorCategory::CHAIN_INTEGRITY_ERROR,
            "Audit ledger is on integrity hold");
    }

    std::future<Result<AuditEntry>> committed;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return Result<AuditEntry>::error(ErrorCategory::STORAGE_ERROR,
                "Audit ledger is shut down");
        }
        Pending pending{std::move(entry), {}};
        committed = pending.done.get_future();
        queue_.push_back(std::move(pending));
    }
    queue_cv_.notify_one();
    return committed.get();
}

void AuditLedger::writer_thread_func() {
    while (true) {
        std::deque<Pending> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty() && stopping_) break;
            batch.swap(queue_);
        }

        for (auto& pending : batch) {
            pending.done.set_value(commit(std::move(pending.entry)));
        }
    }
}

Result<AuditEntry> AuditLedger::commit(AuditEntry entry) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (hold_.load(std::memory_order_acquire)) {
        return Result<AuditEntry>::error(ErrorCategory::CHAIN_INTEGRITY_ERROR,
            "Audit ledger is on integrity hold");
    }

    entry.seq = next_seq_;
    if (entry.ts.empty()) {
        entry.ts = utils::format_timestamp_utc(utils::now());
    }
    entry.prev_hash = tail_hash_;
    entry.curr_hash = audit_codec::compute_hash(entry, entry.prev_hash);

    if (!sink_->write(audit_codec::serialize(entry))) {
        utils::log::error(std::format("Audit append for {} failed on {}",
            entry.operation_id, sink_->name()));
        return Result<AuditEntry>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Audit sink {} rejected the entry", sink_->name()));
    }
    sink_->flush();

    tail_hash_ = entry.curr_hash;
    ++next_seq_;
    by_operation_[entry.operation_id].push_back(entries_.size());
    entries_.push_back(entry);

    utils::log::debug(std::format("Audit seq={} {} op={} outcome={}",
        entry.seq, audit_event_to_string(entry.event), entry.operation_id,
        audit_outcome_to_string(entry.outcome)));
    return Result<AuditEntry>::ok(std::move(entry));
}

VerificationReport AuditLedger::verify() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return verify_locked();
}

VerificationReport AuditLedger::verify_locked() {
    VerificationReport report;

    const auto fail = [&](uint64_t position, std::string reason) {
        report.ok = false;
        report.broken_at = position;
        report.reason = std::move(reason);
        if (!hold_.exchange(true, std::memory_order_acq_rel)) {
            utils::log::error(std::format("Audit ledger {} broken at entry {}: {}. Appends on hold.",
                sink_->name(), position, report.reason));
        }
        return report;
    };

    auto loaded = sink_->load();
    if (loaded.is_error()) {
        return fail(1, loaded.error_message());
    }

    std::vector<AuditEntry> replayed;
    replayed.reserve(loaded.value().size());
    std::string expected_prev(digest::kGenesisHash);

    for (const auto& line : loaded.value()) {
        const uint64_t position = replayed.size() + 1;
        auto parsed = audit_codec::parse(line);
        if (parsed.is_error()) {
            return fail(position, parsed.error_message());
        }
        auto& entry = parsed.value();
        if (entry.seq != position) {
            return fail(position, std::format("sequence {} where {} expected", entry.seq, position));
        }
        if (entry.prev_hash != expected_prev) {
            return fail(position, "prev_hash does not match predecessor");
        }
        if (audit_codec::compute_hash(entry, entry.prev_hash) != entry.curr_hash) {
            return fail(position, "curr_hash does not match entry contents");
        }
        expected_prev = entry.curr_hash;
        replayed.push_back(std::move(entry));
        ++report.entries_checked;
    }

    entries_ = std::move(replayed);
    by_operation_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        by_operation_[entries_[i].operation_id].push_back(i);
    }
    tail_hash_ = expected_prev;
    next_seq_ = entries_.size() + 1;

    if (hold_.exchange(false, std::memory_order_acq_rel)) {
        utils::log::info(std::format("Audit ledger {} verified, integrity hold lifted",
            sink_->name()));
    }
    return report;
}

void AuditLedger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && !writer_thread_.joinable()) return;
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
        std::lock_guard<std::mutex> lock(state_mutex_);
        sink_->shutdown();
    }
}

std::vector<AuditEntry> AuditLedger::entries() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return entries_;
}

std::vector<AuditEntry> AuditLedger::find_by_operation(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<AuditEntry> out;
    const auto it = by_operation_.find(operation_id);
    if (it == by_operation_.end()) return out;
    out.reserve(it->second.size());
    for (const size_t i : it->second) {
        out.push_back(entries_[i]);
    }
    return out;
}

bool AuditLedger::has_committed_scrub(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto it = by_operation_.find(operation_id);
    if (it == by_operation_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(), [this](size_t i) {
        return entries_[i].event == AuditEvent::SCRUB && entries_[i].outcome == AuditOutcome::SUCCESS;
    });
}

size_t AuditLedger::size() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return entries_.size();
}

std::string AuditLedger::tail_hash() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tail_hash_;
}

std::string AuditLedger::sink_name() const {
    return sink_->name();
}

} // namespace redactguard
