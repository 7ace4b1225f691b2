#include "fusion/fusion_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace redactguard {

namespace {

bool ranges_overlap(const Span& a, const Span& b) {
    return !(a.end <= b.start || b.end <= a.start);
}

void add_unique(std::vector<std::string>& ids, const std::string& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // anonymous namespace

// ============================================================================
// Settings
// ============================================================================

FusionSettings FusionSettings::defaults() {
    FusionSettings s;
    s.label_priority = {"PAN", "IBAN", "NATIONAL_ID", "SSN", "EMAIL", "PHONE",
                        "BIC", "IPV4", "DOB", "NAME", "ADDRESS", "ORG_NAME"};

    // Lower requested clearance means stricter evidence for model-only entities
    s.model_thresholds[Tier::C1] = {{"NAME", 0.85}, {"ADDRESS", 0.90}, {"ORG_NAME", 0.90}};
    s.model_thresholds[Tier::C2] = {{"NAME", 0.80}, {"ADDRESS", 0.85}, {"ORG_NAME", 0.85}};
    s.model_thresholds[Tier::C3] = {{"NAME", 0.75}, {"ADDRESS", 0.80}, {"ORG_NAME", 0.80}};
    s.model_thresholds[Tier::C4] = {{"NAME", 0.70}, {"ADDRESS", 0.75}, {"ORG_NAME", 0.75}};

    s.model_label_tiers = {{"NAME", Tier::C2}, {"ADDRESS", Tier::C3}, {"ORG_NAME", Tier::C2}};
    return s;
}

FusionEngine::FusionEngine(FusionSettings settings)
    : settings_(std::move(settings)) {}

std::optional<FusionModeSpec> FusionEngine::parse_mode(std::string_view text) {
    const std::string lower = utils::to_lower(utils::trim(text));
    FusionModeSpec spec;

    if (lower.empty() || lower == "max") {
        spec.mode = FusionMode::MAX;
        return spec;
    }
    if (lower == "avg") {
        spec.mode = FusionMode::AVG;
        return spec;
    }
    if (lower.starts_with("weighted")) {
        spec.mode = FusionMode::WEIGHTED;
        spec.weight = 0.7;
        const auto colon = lower.find(':');
        if (colon != std::string::npos) {
            if (const auto w = utils::try_parse_double(lower.substr(colon + 1))) {
                spec.weight = std::clamp(*w, 0.0, 1.0);
            }
        }
        return spec;
    }
    return std::nullopt;
}

// ============================================================================
// Scoring
// ============================================================================

double FusionEngine::combine(double rule, double external) const {
    switch (settings_.mode.mode) {
        case FusionMode::MAX:
            return std::max(rule, external);
        case FusionMode::AVG:
            return (rule + external) / 2.0;
        case FusionMode::WEIGHTED: {
            const double w = settings_.mode.weight;
            return w * rule + (1.0 - w) * external;
        }
    }
    return rule;
}

size_t FusionEngine::priority_rank(const std::string& label) const {
    const auto& order = settings_.label_priority;
    const auto it = std::find(order.begin(), order.end(), label);
    return static_cast<size_t>(it - order.begin());
}

double FusionEngine::model_threshold(Tier requested_tier, const std::string& label) const {
    const auto tier_it = settings_.model_thresholds.find(requested_tier);
    if (tier_it != settings_.model_thresholds.end()) {
        const auto it = tier_it->second.find(label);
        if (it != tier_it->second.end()) return it->second;
        const auto any = tier_it->second.find(std::string(FusionSettings::kAnyLabel));
        if (any != tier_it->second.end()) return any->second;
    }
    return settings_.default_model_threshold;
}

// ============================================================================
// Fusion
// ============================================================================

std::vector<FusedEntity> FusionEngine::fuse(
    const std::vector<CandidateEntity>& pattern,
    const std::vector<ExternalCandidate>& external,
    Tier requested_tier,
    size_t content_length,
    const std::optional<CellCoordinate>& cell) const {

    // External spans must lie inside the unit; anything else is model noise
    std::vector<ExternalCandidate> ext;
    ext.reserve(external.size());
    for (const auto& e : external) {
        if (e.span.start >= e.span.end || e.span.end > content_length) {
            utils::log::debug(std::format("Fusion: discarding external span [{},{}) for {}",
                e.span.start, e.span.end, e.label));
            continue;
        }
        ext.push_back(e);
    }

    std::vector<CandidateEntity> members;
    members.reserve(pattern.size() + ext.size());
    for (const auto& c : pattern) {
        if (c.span.start < c.span.end) {
            members.push_back(c);
        }
    }

    if (settings_.accept_model_only) {
        for (const auto& e : ext) {
            if (e.score < model_threshold(requested_tier, e.label)) continue;
            CandidateEntity c;
            c.label = e.label;
            c.span = e.span;
            c.span.cell = cell;
            c.confidence = std::clamp(e.score, 0.0, 1.0);
            c.detector_id = "model";
            c.rule_id = "model:" + e.label;
            const auto tier_it = settings_.model_label_tiers.find(e.label);
            c.tier = tier_it != settings_.model_label_tiers.end()
                ? tier_it->second : settings_.default_model_tier;
            c.source = CandidateSource::EXTERNAL;
            members.push_back(std::move(c));
        }
    }

    std::sort(members.begin(), members.end(), [](const auto& a, const auto& b) {
        if (a.span.start != b.span.start) return a.span.start < b.span.start;
        return a.span.end > b.span.end;
    });

    std::vector<FusedEntity> fused;
    size_t i = 0;
    while (i < members.size()) {
        // Interval merge: extend the cluster while the next start is inside it
        size_t cluster_end = members[i].span.end;
        size_t j = i + 1;
        while (j < members.size() && members[j].span.start < cluster_end) {
            cluster_end = std::max(cluster_end, members[j].span.end);
            ++j;
        }

        const CandidateEntity* winner = &members[i];
        for (size_t k = i + 1; k < j; ++k) {
            const auto& c = members[k];
            const size_t len = c.span.length();
            const size_t best_len = winner->span.length();
            if (len != best_len) {
                if (len > best_len) winner = &c;
                continue;
            }
            const size_t rank = priority_rank(c.label);
            const size_t best_rank = priority_rank(winner->label);
            if (rank != best_rank) {
                if (rank < best_rank) winner = &c;
                continue;
            }
            if (c.span.start < winner->span.start) winner = &c;
        }

        FusedEntity entity;
        entity.label = winner->label;
        entity.span = winner->span;
        entity.tier = winner->tier;
        entity.rule_id = winner->rule_id;
        entity.validated = winner->validated;
        for (size_t k = i; k < j; ++k) {
            add_unique(entity.detector_ids, members[k].detector_id);
        }

        std::optional<double> best_external;
        for (const auto& e : ext) {
            if (ranges_overlap(e.span, winner->span)) {
                if (!best_external || e.score > *best_external) {
                    best_external = std::clamp(e.score, 0.0, 1.0);
                }
            }
        }

        if (winner->source == CandidateSource::EXTERNAL) {
            entity.rule_confidence = 0.0;
            entity.external_score = best_external.value_or(winner->confidence);
            entity.confidence = *entity.external_score;
        } else {
            entity.rule_confidence = winner->confidence;
            if (best_external) {
                entity.external_score = best_external;
                entity.confidence = combine(winner->confidence, *best_external);
                add_unique(entity.detector_ids, "model");
            } else {
                entity.confidence = winner->confidence;
            }
        }

        fused.push_back(std::move(entity));
        i = j;
    }

    return fused;
}

} // namespace redactguard
