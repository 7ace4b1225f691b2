#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

/**
 * @brief Append-only storage for serialized ledger lines
 *
 * write/flush/shutdown are called only from the AuditLedger writer thread.
 * load() is called by the ledger under its state lock, at open and on
 * verify(), to read back what is actually stored.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Append one serialized entry (no trailing newline). Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    virtual void flush() = 0;

    virtual void shutdown() = 0;

    /// Stored lines in append order
    [[nodiscard]] virtual Result<std::vector<std::string>> load() const = 0;

    /// e.g. "file:/var/lib/redactguard/audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace redactguard
