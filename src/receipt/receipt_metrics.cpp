#include "receipt/receipt_metrics.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace redactguard {

namespace {

std::string counts_json(const std::map<std::string, size_t>& counts) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, n] : counts) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":{}", utils::escape_json(key), n);
    }
    out += '}';
    return out;
}

// Median (mean of the middle pair for even counts); input sorted
uint64_t median(const std::vector<uint64_t>& sorted) {
    if (sorted.empty()) return 0;
    const size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) return sorted[mid];
    return static_cast<uint64_t>(std::llround((sorted[mid - 1] + sorted[mid]) / 2.0));
}

} // anonymous namespace

std::string ReceiptMetrics::to_json() const {
    return std::format(
        "{{\"receipts\":{},\"entities\":{},\"by_label\":{},\"by_action\":{},"
        "\"latency_ms\":{{\"p50\":{},\"p90\":{}}}}}",
        receipts, entities, counts_json(by_label), counts_json(by_action),
        latency_p50_ms, latency_p90_ms);
}

ReceiptMetrics summarize_receipts(const IReceiptStore& store, size_t limit) {
    ReceiptMetrics metrics;
    auto ids = store.operation_ids();
    if (ids.size() > limit) {
        ids.erase(ids.begin(), ids.end() - static_cast<std::ptrdiff_t>(limit));
    }

    std::vector<uint64_t> latencies;
    latencies.reserve(ids.size());
    for (const auto& id : ids) {
        auto loaded = store.get(id);
        if (loaded.is_error()) {
            utils::log::debug(std::format("Metrics: receipt {} skipped: {}", id, loaded.error_message()));
            continue;
        }
        const auto& receipt = loaded.value();
        ++metrics.receipts;
        metrics.entities += receipt.entities.size();
        for (const auto& e : receipt.entities) {
            ++metrics.by_label[e.label];
            ++metrics.by_action[action_to_string(e.action)];
        }
        latencies.push_back(receipt.latency_ms);
    }

    std::sort(latencies.begin(), latencies.end());
    metrics.latency_p50_ms = median(latencies);
    if (!latencies.empty()) {
        metrics.latency_p90_ms = latencies[static_cast<size_t>(0.9 * static_cast<double>(latencies.size() - 1))];
    }
    return metrics;
}

} // namespace redactguard
