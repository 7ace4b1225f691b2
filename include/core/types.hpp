#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

// ============================================================================
// Sensitivity Tiers
// ============================================================================

/**
 * @brief Ordered sensitivity tiers, lowest to highest
 *
 * C1 public/internal, C2 personal, C3 confidential, C4 restricted.
 * Comparison operators follow the enum order.
 */
enum class Tier : uint8_t {
    C1 = 1,
    C2 = 2,
    C3 = 3,
    C4 = 4
};

inline constexpr Tier kAllTiers[] = {Tier::C1, Tier::C2, Tier::C3, Tier::C4};

inline const char* tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::C1: return "C1";
        case Tier::C2: return "C2";
        case Tier::C3: return "C3";
        case Tier::C4: return "C4";
    }
    return "C4";
}

/// Accepts "C1".."C4" in any case
[[nodiscard]] inline std::optional<Tier> parse_tier(std::string_view str) {
    if (str.size() != 2 || (str[0] != 'C' && str[0] != 'c')) return std::nullopt;
    switch (str[1]) {
        case '1': return Tier::C1;
        case '2': return Tier::C2;
        case '3': return Tier::C3;
        case '4': return Tier::C4;
        default:  return std::nullopt;
    }
}

// ============================================================================
// Policy Actions
// ============================================================================

enum class Action : uint8_t {
    ALLOW,      // Leave content unchanged
    MASK,       // Format-preserving obfuscation
    REDACT      // Replace with identifier
};

inline const char* action_to_string(Action action) {
    switch (action) {
        case Action::ALLOW:  return "allow";
        case Action::MASK:   return "mask";
        case Action::REDACT: return "redact";
    }
    return "redact";
}

[[nodiscard]] std::optional<Action> parse_action(std::string_view str);

// ============================================================================
// Spans and Entities
// ============================================================================

/// Structural address of a content unit (e.g. a spreadsheet cell)
struct CellCoordinate {
    std::string sheet;
    std::string cell;

    bool operator==(const CellCoordinate&) const = default;
};

/**
 * @brief Half-open range [start, end) inside one content unit
 *
 * Offsets are bytes into the original content of the unit. For structural
 * content, `cell` names the unit the offsets refer to.
 */
struct Span {
    size_t start = 0;
    size_t end = 0;
    std::optional<CellCoordinate> cell;

    [[nodiscard]] size_t length() const { return end - start; }

    /// Same unit and intersecting ranges
    [[nodiscard]] bool overlaps(const Span& other) const {
        if (cell != other.cell) return false;
        return !(end <= other.start || other.end <= start);
    }
};

enum class CandidateSource : uint8_t {
    PATTERN,
    EXTERNAL
};

/**
 * @brief Proposal from a single detector. Immutable once produced.
 */
struct CandidateEntity {
    std::string label;
    Span span;
    double confidence = 0.0;
    std::string detector_id;
    std::string rule_id;
    Tier tier = Tier::C3;
    bool validated = true;
    CandidateSource source = CandidateSource::PATTERN;
};

/**
 * @brief Winner of one overlap cluster
 *
 * `external_score` is absent when no external candidate overlapped the
 * winning span (or the external model was disabled or failed).
 */
struct FusedEntity {
    std::string label;
    Span span;
    double confidence = 0.0;
    double rule_confidence = 0.0;
    std::optional<double> external_score;
    Tier tier = Tier::C3;
    std::string rule_id;
    std::vector<std::string> detector_ids;
    bool validated = true;
};

/**
 * @brief Entity after policy and substitution
 *
 * `output_span` locates the substituted text inside the redacted unit.
 */
struct EntityOutcome {
    FusedEntity entity;
    std::string identifier;
    Action action = Action::REDACT;
    Span output_span;
};

/// Explainability record for one entity: label, span, detector, confidence, rule, tier
[[nodiscard]] std::string to_explainability_json(const FusedEntity& entity);

// ============================================================================
// Content Units
// ============================================================================

/// One addressable piece of structural content
struct Cell {
    std::string sheet;
    std::string cell;
    std::string text;
};

} // namespace redactguard
