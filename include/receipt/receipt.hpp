#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

/// Whether a scrub must persist a receipt before it can complete
enum class ReceiptMode : uint8_t {
    REQUIRED,   // Default: no receipt, no output
    NONE        // Opt-in irreversible redaction, flagged in the audit entry
};

/// Per-entity reversal material (never holds the raw value)
struct ReceiptEntity {
    std::string identifier;
    std::string label;
    Tier tier = Tier::C4;
    std::string rule_id;
    double confidence = 0.0;
    Action action = Action::REDACT;
    size_t unit = 0;            // Index into Receipt::units
    Span span;                  // Original-content offsets
    Span output_span;           // Offsets in the redacted unit
};

/// Redacted text of one content unit (a flat payload has exactly one)
struct ReceiptUnit {
    std::optional<CellCoordinate> cell;
    std::string scrubbed;
};

/**
 * @brief Everything needed to reverse one scrub operation
 *
 * Written once, keyed by operation_id. Original values exist only as
 * ciphertext in `encrypted_values`, keyed by identifier.
 */
struct Receipt {
    std::string operation_id;
    std::string created_at;
    Tier requested_tier = Tier::C1;
    std::string manifest_version;
    std::string original_hash;
    std::string scrubbed_hash;
    uint64_t latency_ms = 0;            // Scrub wall time up to persisting
    std::vector<ReceiptUnit> units;
    std::vector<ReceiptEntity> entities;
    std::map<std::string, std::string> encrypted_values;    // identifier -> ENC:v1:...
    std::map<std::string, std::string> placeholder_map;     // identifier -> substituted text

    [[nodiscard]] bool structured() const {
        return !units.empty() && units.front().cell.has_value();
    }
};

namespace receipt_codec {

/// Single-line JSON with a fixed field order
[[nodiscard]] std::string serialize(const Receipt& receipt);

/// STORAGE_ERROR if the document is not a well-formed receipt
[[nodiscard]] Result<Receipt> parse(std::string_view json);

} // namespace receipt_codec

} // namespace redactguard
