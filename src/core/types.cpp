#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactguard {

std::optional<Action> parse_action(std::string_view str) {
    const std::string lower = utils::to_lower(utils::trim(str));
    if (lower == "allow") return Action::ALLOW;
    if (lower == "mask") return Action::MASK;
    if (lower == "redact") return Action::REDACT;
    return std::nullopt;
}

std::string to_explainability_json(const FusedEntity& entity) {
    std::string detector;
    for (size_t i = 0; i < entity.detector_ids.size(); ++i) {
        if (i > 0) detector += ',';
        detector += entity.detector_ids[i];
    }

    std::string out = std::format(
        "{{\"label\":\"{}\",\"span\":[{},{}],\"detector\":\"{}\","
        "\"confidence\":{:.4f},\"rule_id\":\"{}\",\"sensitivity_tier\":\"{}\"",
        utils::escape_json(entity.label), entity.span.start, entity.span.end,
        utils::escape_json(detector), entity.confidence,
        utils::escape_json(entity.rule_id), tier_to_string(entity.tier));

    if (entity.span.cell) {
        out += std::format(",\"sheet\":\"{}\",\"cell\":\"{}\"",
            utils::escape_json(entity.span.cell->sheet),
            utils::escape_json(entity.span.cell->cell));
    }
    if (entity.external_score) {
        out += std::format(",\"external_score\":{:.4f}", *entity.external_score);
    }
    out += '}';
    return out;
}

} // namespace redactguard
