#include "core/masking.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <format>

namespace redactguard {

namespace {

bool is_sensitive_byte(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return uc >= 0x80 || std::isalnum(uc);
}

} // anonymous namespace

std::string MaskingEngine::mask_value(std::string_view value, const std::string& label) {
    if (label == "EMAIL" && value.find('@') != std::string_view::npos) {
        return mask_email(value);
    }
    return mask_generic(value);
}

std::string MaskingEngine::mask_generic(std::string_view value) {
    const auto sensitive = static_cast<size_t>(
        std::count_if(value.begin(), value.end(), is_sensitive_byte));
    const size_t keep = sensitive >= kMinAlnumForTail ? kTailKeep : 0;

    std::string result(value);
    size_t seen = 0;
    for (char& c : result) {
        if (!is_sensitive_byte(c)) continue;
        ++seen;
        if (seen + keep > sensitive) continue;
        c = kMaskChar;
    }
    return result;
}

std::string MaskingEngine::mask_email(std::string_view value) {
    const size_t at = value.find('@');
    std::string result(value);
    for (size_t i = 1; i < at; ++i) {
        if (is_sensitive_byte(result[i])) {
            result[i] = kMaskChar;
        }
    }
    return result;
}

std::string MaskingEngine::apply(std::string_view content,
                                 std::vector<Replacement>& replacements) {
    std::sort(replacements.begin(), replacements.end(),
              [](const auto& a, const auto& b) { return a.span.start < b.span.start; });

    std::string out;
    out.reserve(content.size());
    size_t cursor = 0;

    for (auto& r : replacements) {
        if (r.span.start < cursor || r.span.end > content.size() || r.span.start > r.span.end) {
            throw std::invalid_argument(std::format(
                "Replacement [{},{}) overlaps or exceeds content", r.span.start, r.span.end));
        }
        out.append(content.substr(cursor, r.span.start - cursor));
        r.output.start = out.size();
        out += r.text;
        r.output.end = out.size();
        r.output.cell = r.span.cell;
        cursor = r.span.end;
    }
    out.append(content.substr(cursor));
    return out;
}

} // namespace redactguard
