#include "reversal/descrub_engine.hpp"
#include "core/scrub_pipeline.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <stdexcept>

namespace redactguard {

DeScrubEngine::DeScrubEngine(DeScrubComponents components)
    : c_(std::move(components)) {
    if (!c_.receipts || !c_.cipher || !c_.ledger) {
        throw std::invalid_argument("DeScrubEngine: missing component");
    }
    if (!c_.roles) {
        c_.roles = std::make_shared<RoleRegistry>();
    }
}

Result<DeScrubResult> DeScrubEngine::descrub(const DeScrubRequest& request) const {
    // ===== Request validation (not audited) =====

    if (utils::trim(request.justification).empty()) {
        return Result<DeScrubResult>::error(ErrorCategory::VALIDATION_ERROR,
            "A justification is required for reversal");
    }
    if (utils::trim(request.actor).empty()) {
        return Result<DeScrubResult>::error(ErrorCategory::VALIDATION_ERROR,
            "Actor is required");
    }
    if (request.identifiers && request.identifiers->empty()) {
        return Result<DeScrubResult>::error(ErrorCategory::VALIDATION_ERROR,
            "Selective reversal needs at least one identifier");
    }

    auto loaded = c_.receipts->get(request.operation_id);
    if (loaded.is_error()) {
        return Result<DeScrubResult>::error(loaded.error_category(), loaded.error_message());
    }
    const Receipt& receipt = loaded.value();

    // A receipt counts only once its scrub is on the ledger
    if (!c_.ledger->has_committed_scrub(receipt.operation_id)) {
        utils::log::warn(std::format("Receipt {} has no committed scrub entry, refusing reversal",
            receipt.operation_id));
        return Result<DeScrubResult>::error(ErrorCategory::NOT_FOUND,
            std::format("Operation {} has no committed scrub", request.operation_id));
    }

    if (request.identifiers) {
        for (const auto& id : *request.identifiers) {
            if (!receipt.placeholder_map.contains(id)) {
                return Result<DeScrubResult>::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("Identifier {} does not belong to operation {}",
                        id, request.operation_id));
            }
        }
    }

    const auto selected = [&](const std::string& id) {
        return !request.identifiers || request.identifiers->contains(id);
    };

    DeScrubResult result;
    AuditEntry entry;
    entry.event = AuditEvent::DESCRUB;
    entry.operation_id = receipt.operation_id;
    entry.actor = request.actor;
    entry.session_id = request.session_id;
    entry.original_hash = receipt.original_hash;
    entry.scrubbed_hash = receipt.scrubbed_hash;
    entry.justification = request.justification;

    std::set<std::string> listed;
    for (const auto& e : receipt.entities) {
        if (!selected(e.identifier)) continue;
        result.required_tier = std::max(result.required_tier, e.tier);
        if (listed.insert(e.identifier).second) {
            entry.entities.push_back(e.identifier);
            entry.actions.emplace_back(action_to_string(e.action));
            entry.confidences.push_back(e.confidence);
        }
    }
    entry.tier = tier_to_string(result.required_tier);

    const auto commit = [&](DeScrubOutcome outcome) -> Result<DeScrubResult> {
        result.outcome = outcome;
        entry.outcome = outcome == DeScrubOutcome::GRANTED ? AuditOutcome::GRANTED
                      : outcome == DeScrubOutcome::DENIED  ? AuditOutcome::DENIED
                                                            : AuditOutcome::ERROR;
        auto appended = c_.ledger->append(std::move(entry));
        if (appended.is_error()) {
            utils::log::error(std::format("Reversal of {} not audited: {}",
                request.operation_id, appended.error_message()));
            return Result<DeScrubResult>::error(appended.error_category(),
                appended.error_message());
        }
        result.audit_seq = appended.value().seq;
        utils::log::info(std::format("Reversal of {} by {} ({}): {} entities={}",
            request.operation_id, request.actor, request.role,
            descrub_outcome_to_string(outcome), listed.size()));
        return Result<DeScrubResult>::ok(std::move(result));
    };

    // ===== Clearance gate =====

    const std::optional<Tier> clearance = request.clearance
        ? request.clearance
        : c_.roles->clearance_for(request.role);

    if (!clearance) {
        result.reason = std::format("Role '{}' has no clearance", request.role);
        return commit(DeScrubOutcome::DENIED);
    }
    if (*clearance < result.required_tier) {
        result.reason = std::format("Clearance {} below required {}",
            tier_to_string(*clearance), tier_to_string(result.required_tier));
        return commit(DeScrubOutcome::DENIED);
    }

    // ===== Decrypt selected values =====

    std::map<std::string, std::string> originals;
    for (const auto& id : listed) {
        const auto sealed = receipt.encrypted_values.find(id);
        if (sealed == receipt.encrypted_values.end()) {
            result.reason = std::format("Receipt has no value for {}", id);
            return commit(DeScrubOutcome::ERROR);
        }
        auto opened = c_.cipher->decrypt(sealed->second);
        if (opened.is_error()) {
            result.reason = std::format("Cannot decrypt {}: {}", id, opened.error_message());
            return commit(DeScrubOutcome::ERROR);
        }
        originals.emplace(id, std::move(opened.value()));
    }

    // ===== Rebuild from the redacted units =====

    std::vector<std::vector<const ReceiptEntity*>> by_unit(receipt.units.size());
    for (const auto& e : receipt.entities) {
        if (e.unit >= receipt.units.size()) {
            result.reason = std::format("Receipt entity {} names unit {}", e.identifier, e.unit);
            return commit(DeScrubOutcome::ERROR);
        }
        by_unit[e.unit].push_back(&e);
    }

    std::vector<std::string> rebuilt(receipt.units.size());
    for (size_t u = 0; u < receipt.units.size(); ++u) {
        const std::string& scrubbed = receipt.units[u].scrubbed;
        auto& list = by_unit[u];
        std::sort(list.begin(), list.end(), [](const auto* a, const auto* b) {
            return a->output_span.start < b->output_span.start;
        });

        std::string out;
        out.reserve(scrubbed.size());
        size_t cursor = 0;
        for (const auto* e : list) {
            const Span& at = e->output_span;
            if (at.start < cursor || at.end > scrubbed.size() || at.start > at.end) {
                result.reason = std::format("Output span of {} is inconsistent", e->identifier);
                return commit(DeScrubOutcome::ERROR);
            }
            const std::string_view placed(scrubbed.data() + at.start, at.length());
            const auto expected = receipt.placeholder_map.find(e->identifier);
            if (expected == receipt.placeholder_map.end() || expected->second != placed) {
                result.reason = std::format("Redacted content does not hold {} at [{},{})",
                    e->identifier, at.start, at.end);
                return commit(DeScrubOutcome::ERROR);
            }

            out.append(scrubbed, cursor, at.start - cursor);
            if (selected(e->identifier)) {
                out += originals.at(e->identifier);
            } else {
                out.append(placed);
            }
            cursor = at.end;
        }
        out.append(scrubbed, cursor, std::string::npos);
        rebuilt[u] = std::move(out);
    }

    result.restored.assign(listed.begin(), listed.end());

    if (receipt.structured()) {
        std::vector<Cell> cells;
        cells.reserve(rebuilt.size());
        for (size_t u = 0; u < rebuilt.size(); ++u) {
            const auto& coord = *receipt.units[u].cell;
            cells.push_back(Cell{coord.sheet, coord.cell, std::move(rebuilt[u])});
        }
        if (!request.identifiers && content_hash(cells) != receipt.original_hash) {
            result.reason = "Restored document does not match the original hash";
            return commit(DeScrubOutcome::ERROR);
        }
        result.cells = std::move(cells);
    } else {
        std::string content = rebuilt.empty() ? std::string() : std::move(rebuilt.front());
        if (!request.identifiers && content_hash(content) != receipt.original_hash) {
            result.reason = "Restored content does not match the original hash";
            return commit(DeScrubOutcome::ERROR);
        }
        result.content = std::move(content);
    }

    // Content leaves only once the grant is on the ledger
    return commit(DeScrubOutcome::GRANTED);
}

} // namespace redactguard
