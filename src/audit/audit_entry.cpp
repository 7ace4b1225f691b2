#include "audit/audit_entry.hpp"
#include "core/digest.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactguard::audit_codec {

namespace {

std::string string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        out += utils::escape_json(values[i]);
        out += '"';
    }
    out += ']';
    return out;
}

std::string number_array(const std::vector<double>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("{:.6f}", values[i]);
    }
    out += ']';
    return out;
}

// Everything up to (not including) the closing brace
std::string canonical_body(const AuditEntry& e) {
    std::string out;
    out.reserve(512);
    out += std::format(
        "{{\"seq\":{},\"event\":\"{}\",\"operation_id\":\"{}\",\"ts\":\"{}\","
        "\"actor\":\"{}\",\"session_id\":\"{}\",\"tier\":\"{}\","
        "\"original_hash\":\"{}\",\"scrubbed_hash\":\"{}\",",
        e.seq, audit_event_to_string(e.event), utils::escape_json(e.operation_id),
        utils::escape_json(e.ts), utils::escape_json(e.actor),
        utils::escape_json(e.session_id), utils::escape_json(e.tier),
        e.original_hash, e.scrubbed_hash);
    out += "\"actions\":" + string_array(e.actions) + ',';
    out += "\"entities\":" + string_array(e.entities) + ',';
    out += "\"confidences\":" + number_array(e.confidences) + ',';
    if (e.justification) {
        out += std::format("\"justification\":\"{}\",", utils::escape_json(*e.justification));
    } else {
        out += "\"justification\":null,";
    }
    out += std::format("\"outcome\":\"{}\",\"receipt_less\":{},\"degraded\":{}",
        audit_outcome_to_string(e.outcome), utils::booltostr(e.receipt_less),
        utils::booltostr(e.degraded));
    return out;
}

std::optional<AuditEvent> parse_event(const std::string& s) {
    if (s == "scrub") return AuditEvent::SCRUB;
    if (s == "descrub") return AuditEvent::DESCRUB;
    return std::nullopt;
}

std::optional<AuditOutcome> parse_outcome(const std::string& s) {
    if (s == "success") return AuditOutcome::SUCCESS;
    if (s == "granted") return AuditOutcome::GRANTED;
    if (s == "denied") return AuditOutcome::DENIED;
    if (s == "error") return AuditOutcome::ERROR;
    return std::nullopt;
}

} // anonymous namespace

std::string canonical(const AuditEntry& entry) {
    return canonical_body(entry) + '}';
}

std::string serialize(const AuditEntry& entry) {
    std::string out = canonical_body(entry);
    out += std::format(",\"prev_hash\":\"{}\",\"curr_hash\":\"{}\"}}",
        entry.prev_hash, entry.curr_hash);
    return out;
}

std::string compute_hash(const AuditEntry& entry, const std::string& prev_hash) {
    return digest::sha256_hex(prev_hash, canonical(entry));
}

Result<AuditEntry> parse(std::string_view line) {
    try {
        const auto doc = JsonValue::parse(line);
        if (!doc.is_object()) {
            return Result<AuditEntry>::error(ErrorCategory::CHAIN_INTEGRITY_ERROR,
                "Ledger line is not a JSON object");
        }

        AuditEntry e;
        e.seq = doc.value<uint64_t>("seq", 0);
        e.operation_id = doc.value("operation_id", "");
        e.ts = doc.value("ts", "");
        e.actor = doc.value("actor", "");
        e.session_id = doc.value("session_id", "");
        e.tier = doc.value("tier", "");
        e.original_hash = doc.value("original_hash", "");
        e.scrubbed_hash = doc.value("scrubbed_hash", "");
        e.receipt_less = doc.value("receipt_less", false);
        e.degraded = doc.value("degraded", false);
        e.prev_hash = doc.value("prev_hash", "");
        e.curr_hash = doc.value("curr_hash", "");

        const auto event = parse_event(doc.value("event", ""));
        const auto outcome = parse_outcome(doc.value("outcome", ""));
        if (!event || !outcome) {
            return Result<AuditEntry>::error(ErrorCategory::CHAIN_INTEGRITY_ERROR,
                "Ledger line has unknown event or outcome");
        }
        e.event = *event;
        e.outcome = *outcome;

        for (const auto& v : doc["actions"].elements()) {
            e.actions.push_back(v.get<std::string>());
        }
        for (const auto& v : doc["entities"].elements()) {
            e.entities.push_back(v.get<std::string>());
        }
        for (const auto& v : doc["confidences"].elements()) {
            e.confidences.push_back(v.get<double>());
        }
        const auto justification = doc["justification"];
        if (justification.is_string()) {
            e.justification = justification.get<std::string>();
        }

        return Result<AuditEntry>::ok(std::move(e));

    } catch (const std::exception& ex) {
        return Result<AuditEntry>::error(ErrorCategory::CHAIN_INTEGRITY_ERROR,
            std::format("Ledger line unreadable: {}", ex.what()));
    }
}

} // namespace redactguard::audit_codec
