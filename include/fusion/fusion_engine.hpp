#pragma once

#include "core/types.hpp"
#include "fusion/recognition_model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace redactguard {

enum class FusionMode : uint8_t {
    MAX,        // max(rule, external), never below rule-only
    AVG,        // (rule + external) / 2
    WEIGHTED    // w * rule + (1 - w) * external
};

struct FusionModeSpec {
    FusionMode mode = FusionMode::MAX;
    double weight = 0.7;
};

struct FusionSettings {
    /// Threshold key that applies to every label of a tier
    static constexpr std::string_view kAnyLabel = "*";

    FusionModeSpec mode;

    /// Tie-break order when spans have equal length; unlisted labels rank last
    std::vector<std::string> label_priority;

    /// External candidates may win a cluster (otherwise they only add scores)
    bool accept_model_only = false;

    /// Minimum model score for a model-only entity, per requested tier and label (or kAnyLabel)
    std::unordered_map<Tier, std::unordered_map<std::string, double>> model_thresholds;
    double default_model_threshold = 0.80;

    /// Tier assigned to model-only labels
    std::unordered_map<std::string, Tier> model_label_tiers;
    Tier default_model_tier = Tier::C2;

    /// Defaults for the NAME / ADDRESS / ORG_NAME model vocabulary
    [[nodiscard]] static FusionSettings defaults();
};

/**
 * @brief Resolves overlapping candidates into non-overlapping entities
 *
 * 1. Interval-merge all participating candidates into overlap clusters.
 * 2. Winner per cluster: longest span, then label priority, then left-most.
 * 3. Confidence: fusion mode over the winner's rule confidence and the best
 *    external score overlapping the winning span.
 * 4. No overlapping external score: rule confidence unchanged, and
 *    external_score stays empty.
 *
 * Stateless after construction; fuse() is const and thread-safe.
 */
class FusionEngine {
public:
    explicit FusionEngine(FusionSettings settings = FusionSettings::defaults());

    /**
     * @brief Fuse candidates for one content unit
     * @param pattern Candidates from the detector registry
     * @param external Normalised model output (may be empty)
     * @param requested_tier Selects the model-only thresholds
     * @param content_length External spans past this are discarded
     * @param cell Coordinate stamped onto model-only winners
     */
    [[nodiscard]] std::vector<FusedEntity> fuse(
        const std::vector<CandidateEntity>& pattern,
        const std::vector<ExternalCandidate>& external,
        Tier requested_tier,
        size_t content_length,
        const std::optional<CellCoordinate>& cell = std::nullopt) const;

    [[nodiscard]] double combine(double rule, double external) const;

    [[nodiscard]] const FusionSettings& settings() const { return settings_; }

    /**
     * @brief Parse "max", "avg" or "weighted:<w>"
     * Weight is clamped to [0,1]; an unparsable weight falls back to 0.7.
     * @return nullopt for an unknown mode name
     */
    [[nodiscard]] static std::optional<FusionModeSpec> parse_mode(std::string_view text);

private:
    [[nodiscard]] size_t priority_rank(const std::string& label) const;
    [[nodiscard]] double model_threshold(Tier requested_tier, const std::string& label) const;

    FusionSettings settings_;
};

} // namespace redactguard
