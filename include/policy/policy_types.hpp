#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace redactguard {

/// Per-label entry in a tier manifest
struct LabelRule {
    bool enabled = true;
    Action action = Action::REDACT;
};

/**
 * @brief Policy for one sensitivity tier
 *
 * Loaded from one TOML file. An absent default_action means the manifest
 * has no opinion on unconfigured labels and the engine fails closed.
 */
struct PolicyManifest {
    Tier tier = Tier::C4;
    std::string version;
    std::optional<Action> default_action;
    std::unordered_map<std::string, LabelRule> labels;
    std::string source;                 // File path or "<string>"
};

/**
 * @brief Immutable collection of tier manifests
 *
 * Shared by every in-flight operation that started while it was active.
 */
struct PolicySet {
    std::map<Tier, PolicyManifest> manifests;

    [[nodiscard]] const PolicyManifest* find(Tier tier) const {
        const auto it = manifests.find(tier);
        return it != manifests.end() ? &it->second : nullptr;
    }

    /// "C1:2025.1,C3:2025.2" over the loaded tiers, in tier order
    [[nodiscard]] std::string version() const {
        std::string out;
        for (const auto& [tier, manifest] : manifests) {
            if (!out.empty()) out += ',';
            out += tier_to_string(tier);
            out += ':';
            out += manifest.version;
        }
        return out;
    }
};

struct PolicyDecision {
    Action action = Action::REDACT;
    bool fail_closed = false;           // No manifest or no default applied
};

} // namespace redactguard
