#include "receipt/receipt.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactguard::receipt_codec {

namespace {

std::string string_map_json(const std::map<std::string, std::string>& m) {
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : m) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":\"{}\"", utils::escape_json(k), utils::escape_json(v));
    }
    out += '}';
    return out;
}

Span read_span(const JsonValue& arr) {
    Span s;
    if (arr.is_array() && arr.size() == 2) {
        s.start = arr[size_t{0}].get<size_t>();
        s.end = arr[size_t{1}].get<size_t>();
    }
    return s;
}

} // anonymous namespace

std::string serialize(const Receipt& r) {
    std::string out;
    out.reserve(512 + r.entities.size() * 256);

    out += std::format(
        "{{\"operation_id\":\"{}\",\"created_at\":\"{}\",\"requested_tier\":\"{}\","
        "\"manifest_version\":\"{}\",\"original_hash\":\"{}\",\"scrubbed_hash\":\"{}\","
        "\"latency_ms\":{},",
        utils::escape_json(r.operation_id), utils::escape_json(r.created_at),
        tier_to_string(r.requested_tier), utils::escape_json(r.manifest_version),
        r.original_hash, r.scrubbed_hash, r.latency_ms);

    out += "\"units\":[";
    for (size_t i = 0; i < r.units.size(); ++i) {
        const auto& u = r.units[i];
        if (i > 0) out += ',';
        out += '{';
        if (u.cell) {
            out += std::format("\"sheet\":\"{}\",\"cell\":\"{}\",",
                utils::escape_json(u.cell->sheet), utils::escape_json(u.cell->cell));
        }
        out += std::format("\"scrubbed\":\"{}\"}}", utils::escape_json(u.scrubbed));
    }
    out += "],";

    out += "\"entities\":[";
    for (size_t i = 0; i < r.entities.size(); ++i) {
        const auto& e = r.entities[i];
        if (i > 0) out += ',';
        out += std::format(
            "{{\"identifier\":\"{}\",\"label\":\"{}\",\"tier\":\"{}\",\"rule_id\":\"{}\","
            "\"confidence\":{:.4f},\"action\":\"{}\",\"unit\":{},\"span\":[{},{}],"
            "\"output_span\":[{},{}]}}",
            utils::escape_json(e.identifier), utils::escape_json(e.label), tier_to_string(e.tier),
            utils::escape_json(e.rule_id), e.confidence, action_to_string(e.action), e.unit,
            e.span.start, e.span.end, e.output_span.start, e.output_span.end);
    }
    out += "],";

    out += "\"encrypted_values\":" + string_map_json(r.encrypted_values) + ',';
    out += "\"placeholder_map\":" + string_map_json(r.placeholder_map);
    out += '}';
    return out;
}

Result<Receipt> parse(std::string_view json) {
    try {
        const auto doc = JsonValue::parse(json);
        if (!doc.is_object()) {
            return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR, "Receipt is not a JSON object");
        }

        Receipt r;
        r.operation_id = doc.value("operation_id", "");
        r.created_at = doc.value("created_at", "");
        r.manifest_version = doc.value("manifest_version", "");
        r.original_hash = doc.value("original_hash", "");
        r.scrubbed_hash = doc.value("scrubbed_hash", "");
        r.latency_ms = doc.value<uint64_t>("latency_ms", 0);

        const auto tier = parse_tier(doc.value("requested_tier", ""));
        if (r.operation_id.empty() || !tier) {
            return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR,
                "Receipt missing operation_id or requested_tier");
        }
        r.requested_tier = *tier;

        for (const auto& u : doc["units"].elements()) {
            ReceiptUnit unit;
            if (u.contains("cell")) {
                unit.cell = CellCoordinate{u.value("sheet", ""), u.value("cell", "")};
            }
            unit.scrubbed = u.value("scrubbed", "");
            r.units.push_back(std::move(unit));
        }

        for (const auto& e : doc["entities"].elements()) {
            ReceiptEntity entity;
            entity.identifier = e.value("identifier", "");
            entity.label = e.value("label", "");
            entity.rule_id = e.value("rule_id", "");
            entity.confidence = e.value("confidence", 0.0);
            entity.unit = e.value<size_t>("unit", 0);
            entity.span = read_span(e["span"]);
            entity.output_span = read_span(e["output_span"]);

            const auto etier = parse_tier(e.value("tier", ""));
            const auto action = parse_action(e.value("action", ""));
            if (entity.identifier.empty() || !etier || !action || entity.unit >= r.units.size()) {
                return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR,
                    std::format("Receipt {} has a malformed entity", r.operation_id));
            }
            entity.tier = *etier;
            entity.action = *action;
            entity.span.cell = r.units[entity.unit].cell;
            entity.output_span.cell = r.units[entity.unit].cell;
            r.entities.push_back(std::move(entity));
        }

        for (const auto& [k, v] : doc["encrypted_values"].items()) {
            if (v.is_string()) r.encrypted_values[k] = v.get<std::string>();
        }
        for (const auto& [k, v] : doc["placeholder_map"].items()) {
            if (v.is_string()) r.placeholder_map[k] = v.get<std::string>();
        }

        return Result<Receipt>::ok(std::move(r));

    } catch (const JsonValue::parse_error& e) {
        return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Receipt is not valid JSON: {}", e.what()));
    } catch (const std::exception& e) {
        return Result<Receipt>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Receipt could not be read: {}", e.what()));
    }
}

} // namespace redactguard::receipt_codec
