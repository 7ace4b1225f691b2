#pragma once

#include "audit/audit_ledger.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/detector_registry.hpp"
#include "fusion/fusion_engine.hpp"
#include "fusion/recognition_model.hpp"
#include "policy/policy_engine.hpp"
#include "receipt/receipt.hpp"
#include "receipt/receipt_store.hpp"
#include "security/identifier_generator.hpp"
#include "security/receipt_cipher.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

enum class OperationState : uint8_t {
    RECEIVED,
    DETECTING,
    FUSING,
    POLICY_APPLYING,
    SUBSTITUTING,
    PERSISTING,
    LOGGED,
    FAILED
};

const char* operation_state_to_string(OperationState state);

/**
 * @brief Everything the scrub pipeline talks to
 *
 * Built once by Service; tests assemble it directly with in-memory stores.
 */
struct ScrubComponents {
    std::shared_ptr<DetectorRegistry> detectors;
    std::shared_ptr<BoundedRecognitionModel> recognizer;
    std::shared_ptr<FusionEngine> fusion;
    std::shared_ptr<PolicyEngine> policy;
    std::shared_ptr<IdentifierGenerator> identifiers;
    std::shared_ptr<ReceiptCipher> cipher;
    std::shared_ptr<IReceiptStore> receipts;
    std::shared_ptr<AuditLedger> ledger;
    ReceiptMode receipt_mode = ReceiptMode::REQUIRED;
    size_t max_content_bytes = 10 * 1024 * 1024;
};

struct ScrubRequest {
    std::string content;
    std::string actor;
    std::string session_id;
    Tier requested_tier = Tier::C1;
};

/// Cell-addressed document; every cell goes through the same pipeline
struct CellScrubRequest {
    std::vector<Cell> cells;
    std::string actor;
    std::string session_id;
    Tier requested_tier = Tier::C1;
};

struct ScrubResult {
    std::string operation_id;
    std::string timestamp;                  // Same value as the receipt and audit entry
    std::string actor;
    std::string session_id;
    Tier requested_tier = Tier::C1;
    OperationState state = OperationState::RECEIVED;
    std::string content;                    // Flat payloads
    std::vector<Cell> cells;                // Cell-addressed payloads
    std::vector<EntityOutcome> entities;    // Ascending by unit, then start
    std::string original_hash;
    std::string scrubbed_hash;
    std::string manifest_version;
    bool degraded = false;                  // External model timed out or failed
    bool receipt_less = false;
    uint64_t audit_seq = 0;
};

/**
 * @brief Scrub orchestrator
 *
 * RECEIVED -> DETECTING -> FUSING -> POLICY_APPLYING -> SUBSTITUTING
 *          -> PERSISTING -> LOGGED, or FAILED from any state.
 *
 * The receipt is written before the audit entry. If the audit append
 * fails, the receipt is invalidated and the operation fails, so no
 * redeemable receipt exists without its ledger entry. The stop_token is
 * checked before every state; the audit append itself is not interrupted.
 *
 * Errors (nothing returned, nothing audited unless noted):
 * - VALIDATION_ERROR       empty actor, NUL bytes, oversized payload, duplicate cells
 * - POLICY_CONFIG_ERROR    no manifest for the requested tier
 * - ENCRYPTION_UNAVAILABLE receipt key missing while receipts are required
 * - STORAGE_ERROR / CONFLICT from the receipt store
 * - CHAIN_INTEGRITY_ERROR  ledger on hold (receipt invalidated)
 * - CANCELLED
 */
class ScrubPipeline {
public:
    explicit ScrubPipeline(ScrubComponents components);

    [[nodiscard]] Result<ScrubResult> scrub(const ScrubRequest& request,
                                            std::stop_token stop = {}) const;

    [[nodiscard]] Result<ScrubResult> scrub_cells(const CellScrubRequest& request,
                                                  std::stop_token stop = {}) const;

    [[nodiscard]] const ScrubComponents& components() const { return c_; }

private:
    struct Unit {
        std::optional<CellCoordinate> cell;
        std::string text;
    };

    Result<ScrubResult> run(std::vector<Unit> units,
                            const std::string& actor,
                            const std::string& session_id,
                            Tier requested_tier,
                            std::stop_token stop) const;

    ScrubComponents c_;
};

/// SHA-256 of a flat payload
[[nodiscard]] std::string content_hash(std::string_view content);

/// SHA-256 over length-prefixed (sheet, cell, text) triples in document order
[[nodiscard]] std::string content_hash(const std::vector<Cell>& cells);

} // namespace redactguard
