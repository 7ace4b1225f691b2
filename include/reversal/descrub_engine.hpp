#pragma once

#include "audit/audit_ledger.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "receipt/receipt_store.hpp"
#include "security/receipt_cipher.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace redactguard {

/**
 * @brief Role name -> clearance tier, from the [roles] config table
 *
 * An unknown role has no clearance.
 */
class RoleRegistry {
public:
    RoleRegistry() = default;
    explicit RoleRegistry(std::unordered_map<std::string, Tier> roles)
        : roles_(std::move(roles)) {}

    [[nodiscard]] std::optional<Tier> clearance_for(const std::string& role) const {
        const auto it = roles_.find(role);
        if (it == roles_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] size_t size() const { return roles_.size(); }

private:
    std::unordered_map<std::string, Tier> roles_;
};

enum class DeScrubOutcome : uint8_t {
    GRANTED,
    DENIED,
    ERROR
};

inline const char* descrub_outcome_to_string(DeScrubOutcome o) {
    switch (o) {
        case DeScrubOutcome::GRANTED: return "granted";
        case DeScrubOutcome::DENIED:  return "denied";
        case DeScrubOutcome::ERROR:   return "error";
    }
    return "error";
}

struct DeScrubRequest {
    std::string operation_id;
    std::string actor;
    std::string session_id;
    std::string role;
    std::optional<Tier> clearance;          // Overrides the role registry when set
    std::string justification;
    std::optional<std::set<std::string>> identifiers;   // nullopt = full reversal
};

struct DeScrubResult {
    DeScrubOutcome outcome = DeScrubOutcome::DENIED;
    std::optional<std::string> content;             // Flat payloads, granted only
    std::optional<std::vector<Cell>> cells;         // Cell-addressed payloads, granted only
    Tier required_tier = Tier::C1;
    std::vector<std::string> restored;              // Identifiers put back
    std::string reason;                             // Denial or error detail
    uint64_t audit_seq = 0;
};

struct DeScrubComponents {
    std::shared_ptr<IReceiptStore> receipts;
    std::shared_ptr<ReceiptCipher> cipher;
    std::shared_ptr<AuditLedger> ledger;
    std::shared_ptr<const RoleRegistry> roles;
};

/**
 * @brief Clearance-gated, justified reversal of a scrub operation
 *
 * Required tier is the highest tier among the selected entities. Every
 * attempt that passes request validation is audited exactly once, whether
 * granted, denied or failed. Content is only returned after its audit
 * entry is committed.
 *
 * Errors: VALIDATION_ERROR (empty justification or actor, identifiers not
 * in the receipt), NOT_FOUND (no redeemable receipt), and ledger errors.
 * A denial is a successful result with outcome DENIED.
 */
class DeScrubEngine {
public:
    explicit DeScrubEngine(DeScrubComponents components);

    [[nodiscard]] Result<DeScrubResult> descrub(const DeScrubRequest& request) const;

private:
    DeScrubComponents c_;
};

} // namespace redactguard
