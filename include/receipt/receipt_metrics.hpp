#pragma once

#include "receipt/receipt_store.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace redactguard {

/**
 * @brief Aggregate view over stored receipts
 *
 * Counts entities per label and per action, plus scrub latency percentiles.
 * Invalidated or unreadable receipts are skipped.
 */
struct ReceiptMetrics {
    size_t receipts = 0;
    size_t entities = 0;
    std::map<std::string, size_t> by_label;
    std::map<std::string, size_t> by_action;
    uint64_t latency_p50_ms = 0;
    uint64_t latency_p90_ms = 0;

    /// Single-line JSON for the CLI
    [[nodiscard]] std::string to_json() const;
};

/// Summarise the last `limit` receipts in operation-id order
[[nodiscard]] ReceiptMetrics summarize_receipts(const IReceiptStore& store, size_t limit = 2000);

} // namespace redactguard
