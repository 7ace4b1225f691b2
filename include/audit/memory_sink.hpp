#pragma once

#include "audit/audit_sink.hpp"

#include <mutex>

namespace redactguard {

/// In-process ledger storage; replace() lets tests tamper with stored lines
class MemorySink : public IAuditSink {
public:
    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] Result<std::vector<std::string>> load() const override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] std::vector<std::string> lines() const;

    /// Overwrite the line at @p index (0-based). Returns false if out of range.
    bool replace(size_t index, std::string line);

    /// Make subsequent write() calls fail
    void set_fail_writes(bool fail);

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    bool fail_writes_ = false;
};

} // namespace redactguard
