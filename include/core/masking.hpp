#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

/// One planned substitution in a content unit
struct Replacement {
    Span span;              // Original-content offsets
    std::string text;       // What goes in its place
    Span output;            // Filled by apply(): offsets in the redacted unit
};

/**
 * @brief Format-preserving masking and span substitution
 *
 * Masking keeps the byte length and every separator; only letters, digits
 * and non-ASCII bytes are replaced with '*'. Values with at least
 * kMinAlnumForTail alphanumerics keep their last kTailKeep ones visible.
 * EMAIL keeps the first character of the local part and the whole domain.
 */
class MaskingEngine {
public:
    static constexpr char kMaskChar = '*';
    static constexpr size_t kTailKeep = 4;
    static constexpr size_t kMinAlnumForTail = 8;

    [[nodiscard]] static std::string mask_value(std::string_view value, const std::string& label);

    /**
     * @brief Substitute replacements into one content unit
     *
     * Replacements must not overlap. They are applied in ascending start
     * order against original offsets while the output is built in one pass,
     * so each `output` span is exact regardless of earlier length changes.
     * Bytes outside every span are copied unchanged.
     *
     * @param replacements Sorted in place; `output` filled for each
     */
    [[nodiscard]] static std::string apply(std::string_view content,
                                           std::vector<Replacement>& replacements);

private:
    static std::string mask_generic(std::string_view value);
    static std::string mask_email(std::string_view value);
};

} // namespace redactguard
