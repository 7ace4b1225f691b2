#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

enum class AuditEvent : uint8_t {
    SCRUB,
    DESCRUB
};

enum class AuditOutcome : uint8_t {
    SUCCESS,    // Scrub committed
    GRANTED,    // Reversal returned content
    DENIED,     // Reversal refused for clearance
    ERROR       // Reversal authorised but could not complete
};

inline const char* audit_event_to_string(AuditEvent e) {
    return e == AuditEvent::SCRUB ? "scrub" : "descrub";
}

inline const char* audit_outcome_to_string(AuditOutcome o) {
    switch (o) {
        case AuditOutcome::SUCCESS: return "success";
        case AuditOutcome::GRANTED: return "granted";
        case AuditOutcome::DENIED:  return "denied";
        case AuditOutcome::ERROR:   return "error";
    }
    return "error";
}

/**
 * @brief One ledger record
 *
 * Holds identifiers, hashes and confidences only; never raw values.
 * `tier` is the requested tier for a scrub and the required tier for a
 * reversal. seq, prev_hash and curr_hash are assigned by the ledger.
 */
struct AuditEntry {
    uint64_t seq = 0;
    AuditEvent event = AuditEvent::SCRUB;
    std::string operation_id;
    std::string ts;
    std::string actor;
    std::string session_id;
    std::string tier;
    std::string original_hash;
    std::string scrubbed_hash;
    std::vector<std::string> actions;
    std::vector<std::string> entities;      // Identifiers
    std::vector<double> confidences;
    std::optional<std::string> justification;
    AuditOutcome outcome = AuditOutcome::SUCCESS;
    bool receipt_less = false;
    bool degraded = false;
    std::string prev_hash;
    std::string curr_hash;
};

namespace audit_codec {

/**
 * @brief Hash input: every field except prev_hash/curr_hash, fixed order,
 * confidences with 6 decimals
 */
[[nodiscard]] std::string canonical(const AuditEntry& entry);

/// canonical() plus prev_hash and curr_hash; one JSONL line without newline
[[nodiscard]] std::string serialize(const AuditEntry& entry);

[[nodiscard]] Result<AuditEntry> parse(std::string_view line);

/// SHA-256(prev_hash ∥ canonical(entry)) as hex
[[nodiscard]] std::string compute_hash(const AuditEntry& entry, const std::string& prev_hash);

} // namespace audit_codec

} // namespace redactguard
