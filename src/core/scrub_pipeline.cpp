#include "core/scrub_pipeline.hpp"
#include "core/digest.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstddef>
#include <format>
#include <set>
#include <stdexcept>

namespace redactguard {

const char* operation_state_to_string(OperationState state) {
    switch (state) {
        case OperationState::RECEIVED:        return "received";
        case OperationState::DETECTING:       return "detecting";
        case OperationState::FUSING:          return "fusing";
        case OperationState::POLICY_APPLYING: return "policy_applying";
        case OperationState::SUBSTITUTING:    return "substituting";
        case OperationState::PERSISTING:      return "persisting";
        case OperationState::LOGGED:          return "logged";
        case OperationState::FAILED:          return "failed";
    }
    return "failed";
}

std::string content_hash(std::string_view content) {
    return digest::sha256_hex(content);
}

std::string content_hash(const std::vector<Cell>& cells) {
    std::string framed;
    for (const auto& c : cells) {
        framed += std::format("{}:{}{}:{}{}:{}", c.sheet.size(), c.sheet,
                              c.cell.size(), c.cell, c.text.size(), c.text);
    }
    return digest::sha256_hex(framed);
}

ScrubPipeline::ScrubPipeline(ScrubComponents components)
    : c_(std::move(components)) {
    if (!c_.detectors || !c_.recognizer || !c_.fusion || !c_.policy ||
        !c_.identifiers || !c_.ledger) {
        throw std::invalid_argument("ScrubPipeline: missing component");
    }
    if (c_.receipt_mode == ReceiptMode::REQUIRED && (!c_.receipts || !c_.cipher)) {
        throw std::invalid_argument("ScrubPipeline: receipts required but no receipt store or cipher");
    }
}

Result<ScrubResult> ScrubPipeline::scrub(const ScrubRequest& request,
                                         std::stop_token stop) const {
    std::vector<Unit> units;
    units.push_back(Unit{std::nullopt, request.content});
    return run(std::move(units), request.actor, request.session_id,
               request.requested_tier, std::move(stop));
}

Result<ScrubResult> ScrubPipeline::scrub_cells(const CellScrubRequest& request,
                                               std::stop_token stop) const {
    std::vector<Unit> units;
    units.reserve(request.cells.size());
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& c : request.cells) {
        if (!seen.emplace(c.sheet, c.cell).second) {
            return Result<ScrubResult>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Duplicate cell {}!{}", c.sheet, c.cell));
        }
        units.push_back(Unit{CellCoordinate{c.sheet, c.cell}, c.text});
    }
    return run(std::move(units), request.actor, request.session_id,
               request.requested_tier, std::move(stop));
}

Result<ScrubResult> ScrubPipeline::run(std::vector<Unit> units,
                                       const std::string& actor,
                                       const std::string& session_id,
                                       Tier requested_tier,
                                       std::stop_token stop) const {
    const auto started = std::chrono::steady_clock::now();
    ScrubResult result;
    result.operation_id = utils::generate_uuid();
    result.actor = actor;
    result.session_id = session_id;
    result.requested_tier = requested_tier;
    const bool structured = units.empty() || units.front().cell.has_value();

    const auto advance = [&](OperationState next) {
        utils::log::debug(std::format("Operation {}: {} -> {}", result.operation_id,
            operation_state_to_string(result.state), operation_state_to_string(next)));
        result.state = next;
    };
    const auto failed = [&](ErrorCategory category, std::string message) {
        advance(OperationState::FAILED);
        utils::log::warn(std::format("Scrub {} failed ({}): {}", result.operation_id,
            error_category_to_string(category), message));
        return Result<ScrubResult>::error(category, std::move(message));
    };

    // ===== Ingress validation =====

    if (utils::trim(actor).empty()) {
        return failed(ErrorCategory::VALIDATION_ERROR, "Actor is required");
    }
    size_t total_bytes = 0;
    for (const auto& u : units) {
        total_bytes += u.text.size();
        if (u.text.find('\0') != std::string::npos) {
            return failed(ErrorCategory::VALIDATION_ERROR, "Content contains NUL bytes");
        }
    }
    if (total_bytes > c_.max_content_bytes) {
        return failed(ErrorCategory::VALIDATION_ERROR,
            std::format("Content is {} bytes, limit is {}", total_bytes, c_.max_content_bytes));
    }

    auto acquired = c_.policy->acquire(requested_tier);
    if (acquired.is_error()) {
        return failed(acquired.error_category(), acquired.error_message());
    }
    const std::shared_ptr<const PolicySet> policies = acquired.value();
    result.manifest_version = policies->version();

    if (stop.stop_requested()) {
        return failed(ErrorCategory::CANCELLED, "Cancelled before detection");
    }

    // ===== Detecting =====

    advance(OperationState::DETECTING);
    std::vector<std::vector<CandidateEntity>> candidates(units.size());
    std::vector<std::vector<ExternalCandidate>> external(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        candidates[i] = c_.detectors->scan(units[i].text, units[i].cell);
        auto recognized = c_.recognizer->recognize(units[i].text);
        if (recognized.degraded) result.degraded = true;
        external[i] = std::move(recognized.candidates);
    }

    if (stop.stop_requested()) {
        return failed(ErrorCategory::CANCELLED, "Cancelled before fusion");
    }

    // ===== Fusing =====

    advance(OperationState::FUSING);
    std::vector<std::vector<FusedEntity>> fused(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        fused[i] = c_.fusion->fuse(candidates[i], external[i], requested_tier,
                                   units[i].text.size(), units[i].cell);
    }

    if (stop.stop_requested()) {
        return failed(ErrorCategory::CANCELLED, "Cancelled before policy");
    }

    // ===== Policy-Applying =====

    advance(OperationState::POLICY_APPLYING);
    std::vector<std::vector<EntityOutcome>> outcomes(units.size());
    size_t fail_closed = 0;
    for (size_t i = 0; i < units.size(); ++i) {
        const std::string_view text = units[i].text;
        for (auto& entity : fused[i]) {
            const auto decision = PolicyEngine::decide(*policies, entity.label, entity.tier);
            if (decision.fail_closed) ++fail_closed;

            EntityOutcome outcome;
            outcome.identifier = c_.identifiers->generate(entity.tier, entity.label,
                text.substr(entity.span.start, entity.span.length()));
            outcome.action = decision.action;
            outcome.entity = std::move(entity);
            outcomes[i].push_back(std::move(outcome));
        }
    }
    if (fail_closed > 0) {
        utils::log::warn(std::format("Operation {}: {} entities redacted by fail-closed default",
            result.operation_id, fail_closed));
    }

    if (stop.stop_requested()) {
        return failed(ErrorCategory::CANCELLED, "Cancelled before substitution");
    }

    // ===== Substituting =====

    advance(OperationState::SUBSTITUTING);
    std::vector<std::string> scrubbed(units.size());
    std::vector<std::vector<std::string>> placeholders(units.size());
    try {
        for (size_t i = 0; i < units.size(); ++i) {
            const std::string_view text = units[i].text;
            std::vector<Replacement> replacements;
            for (const auto& o : outcomes[i]) {
                if (o.action == Action::ALLOW) continue;
                const auto raw = text.substr(o.entity.span.start, o.entity.span.length());
                Replacement r;
                r.span = o.entity.span;
                r.text = o.action == Action::REDACT
                    ? o.identifier
                    : MaskingEngine::mask_value(raw, o.entity.label);
                replacements.push_back(std::move(r));
            }

            scrubbed[i] = MaskingEngine::apply(text, replacements);

            // Outcomes and replacements are both ascending by start
            std::ptrdiff_t delta = 0;
            size_t next = 0;
            placeholders[i].resize(outcomes[i].size());
            for (size_t k = 0; k < outcomes[i].size(); ++k) {
                auto& o = outcomes[i][k];
                if (o.action == Action::ALLOW) {
                    o.output_span = o.entity.span;
                    o.output_span.start = static_cast<size_t>(static_cast<std::ptrdiff_t>(o.entity.span.start) + delta);
                    o.output_span.end = static_cast<size_t>(static_cast<std::ptrdiff_t>(o.entity.span.end) + delta);
                    continue;
                }
                const auto& r = replacements[next++];
                o.output_span = r.output;
                placeholders[i][k] = r.text;
                delta = static_cast<std::ptrdiff_t>(r.output.end) - static_cast<std::ptrdiff_t>(r.span.end);
            }
        }
    } catch (const std::invalid_argument& e) {
        return failed(ErrorCategory::INTERNAL_ERROR,
            std::format("Substitution failed: {}", e.what()));
    }

    if (structured) {
        std::vector<Cell> original_cells;
        original_cells.reserve(units.size());
        for (size_t i = 0; i < units.size(); ++i) {
            original_cells.push_back(Cell{units[i].cell->sheet, units[i].cell->cell, units[i].text});
            result.cells.push_back(Cell{units[i].cell->sheet, units[i].cell->cell, scrubbed[i]});
        }
        result.original_hash = content_hash(original_cells);
        result.scrubbed_hash = content_hash(result.cells);
    } else {
        result.original_hash = content_hash(units.front().text);
        result.content = scrubbed.front();
        result.scrubbed_hash = content_hash(result.content);
    }

    if (stop.stop_requested()) {
        return failed(ErrorCategory::CANCELLED, "Cancelled before persisting");
    }

    // ===== Persisting =====

    advance(OperationState::PERSISTING);
    const std::string created_at = utils::format_timestamp_utc(utils::now());
    result.timestamp = created_at;
    bool receipt_written = false;

    if (c_.receipt_mode == ReceiptMode::REQUIRED) {
        // Every receipt-bearing scrub needs the key, entities or not
        if (!c_.cipher->available()) {
            return failed(ErrorCategory::ENCRYPTION_UNAVAILABLE, "No receipt key available");
        }

        Receipt receipt;
        receipt.operation_id = result.operation_id;
        receipt.created_at = created_at;
        receipt.requested_tier = requested_tier;
        receipt.manifest_version = result.manifest_version;
        receipt.original_hash = result.original_hash;
        receipt.scrubbed_hash = result.scrubbed_hash;
        receipt.latency_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());

        for (size_t i = 0; i < units.size(); ++i) {
            receipt.units.push_back(ReceiptUnit{units[i].cell, scrubbed[i]});
            const std::string_view text = units[i].text;

            for (size_t k = 0; k < outcomes[i].size(); ++k) {
                const auto& o = outcomes[i][k];
                if (o.action == Action::ALLOW) continue;

                if (!receipt.encrypted_values.contains(o.identifier)) {
                    auto sealed = c_.cipher->encrypt(
                        text.substr(o.entity.span.start, o.entity.span.length()));
                    if (sealed.is_error()) {
                        return failed(sealed.error_category(), sealed.error_message());
                    }
                    receipt.encrypted_values.emplace(o.identifier, std::move(sealed.value()));
                    receipt.placeholder_map.emplace(o.identifier, placeholders[i][k]);
                }

                ReceiptEntity re;
                re.identifier = o.identifier;
                re.label = o.entity.label;
                re.tier = o.entity.tier;
                re.rule_id = o.entity.rule_id;
                re.confidence = o.entity.confidence;
                re.action = o.action;
                re.unit = i;
                re.span = o.entity.span;
                re.output_span = o.output_span;
                receipt.entities.push_back(std::move(re));
            }
        }

        auto stored = c_.receipts->put(receipt);
        if (stored.is_error()) {
            return failed(stored.error_category(), stored.error_message());
        }
        receipt_written = true;
    } else {
        result.receipt_less = true;
    }

    const auto discard_receipt = [&](const std::string& reason) {
        if (!receipt_written) return;
        auto invalidated = c_.receipts->invalidate(result.operation_id, reason);
        if (invalidated.is_error()) {
            utils::log::error(std::format("Receipt {} could not be invalidated: {}",
                result.operation_id, invalidated.error_message()));
        }
    };

    if (stop.stop_requested()) {
        discard_receipt("cancelled before audit");
        return failed(ErrorCategory::CANCELLED, "Cancelled before audit");
    }

    // ===== Audit =====

    AuditEntry entry;
    entry.event = AuditEvent::SCRUB;
    entry.operation_id = result.operation_id;
    entry.ts = created_at;
    entry.actor = actor;
    entry.session_id = session_id;
    entry.tier = tier_to_string(requested_tier);
    entry.original_hash = result.original_hash;
    entry.scrubbed_hash = result.scrubbed_hash;
    entry.outcome = AuditOutcome::SUCCESS;
    entry.receipt_less = result.receipt_less;
    entry.degraded = result.degraded;

    for (auto& unit_outcomes : outcomes) {
        for (auto& o : unit_outcomes) {
            entry.actions.emplace_back(action_to_string(o.action));
            entry.entities.push_back(o.identifier);
            entry.confidences.push_back(o.entity.confidence);
            result.entities.push_back(std::move(o));
        }
    }

    auto appended = c_.ledger->append(std::move(entry));
    if (appended.is_error()) {
        discard_receipt("audit append failed");
        return failed(appended.error_category(), appended.error_message());
    }
    result.audit_seq = appended.value().seq;

    advance(OperationState::LOGGED);
    utils::log::info(std::format("Scrub {} tier={} units={} entities={} degraded={} receipt_less={}",
        result.operation_id, tier_to_string(requested_tier), units.size(),
        result.entities.size(), utils::booltostr(result.degraded),
        utils::booltostr(result.receipt_less)));
    return Result<ScrubResult>::ok(std::move(result));
}

} // namespace redactguard
