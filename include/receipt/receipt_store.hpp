#pragma once

#include "core/error.hpp"
#include "receipt/receipt.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace redactguard {

/**
 * @brief Durable, write-once receipt storage keyed by operation_id
 *
 * put() never overwrites: an existing id is CONFLICT. An invalidated
 * receipt (orphaned by a failed audit append) stays on storage for
 * cleanup but get() refuses it.
 */
class IReceiptStore {
public:
    virtual ~IReceiptStore() = default;

    [[nodiscard]] virtual Result<void> put(const Receipt& receipt) = 0;

    /// NOT_FOUND if absent or invalidated
    [[nodiscard]] virtual Result<Receipt> get(const std::string& operation_id) const = 0;

    [[nodiscard]] virtual Result<void> invalidate(const std::string& operation_id,
                                                  const std::string& reason) = 0;

    /// Every stored id in ascending order, invalidated ones included
    [[nodiscard]] virtual std::vector<std::string> operation_ids() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief One JSON file per operation under a directory
 *
 * <dir>/<operation_id>.json is created with O_CREAT|O_EXCL (mode 0600) and
 * fsync'd before put() returns. Invalidation writes <operation_id>.invalid
 * next to it.
 */
class FileReceiptStore : public IReceiptStore {
public:
    explicit FileReceiptStore(std::string directory);

    [[nodiscard]] Result<void> put(const Receipt& receipt) override;
    [[nodiscard]] Result<Receipt> get(const std::string& operation_id) const override;
    [[nodiscard]] Result<void> invalidate(const std::string& operation_id,
                                          const std::string& reason) override;
    [[nodiscard]] std::vector<std::string> operation_ids() const override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const std::string& directory() const { return directory_; }

private:
    [[nodiscard]] std::string receipt_path(const std::string& operation_id) const;
    [[nodiscard]] std::string marker_path(const std::string& operation_id) const;

    std::string directory_;
};

/// In-process store for tests and receipt-only dry runs
class MemoryReceiptStore : public IReceiptStore {
public:
    [[nodiscard]] Result<void> put(const Receipt& receipt) override;
    [[nodiscard]] Result<Receipt> get(const std::string& operation_id) const override;
    [[nodiscard]] Result<void> invalidate(const std::string& operation_id,
                                          const std::string& reason) override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> operation_ids() const override;
    [[nodiscard]] bool is_invalidated(const std::string& operation_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> receipts_;   // Serialized, as on disk
    std::set<std::string> invalidated_;
};

/// Operation ids are UUID-shaped: hex digits and '-', 1..64 chars
[[nodiscard]] bool is_valid_operation_id(const std::string& operation_id);

} // namespace redactguard
