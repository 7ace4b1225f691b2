#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>
#include <format>
#include <fstream>

using namespace std::string_literals;

namespace redactguard {

static constexpr std::string_view kTier          = "tier";
static constexpr std::string_view kVersion       = "version";
static constexpr std::string_view kDefaultAction = "default_action";
static constexpr std::string_view kLabels        = "labels";

// ============================================================================
// Public API - Load from file
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(
    const std::string& path, std::optional<Tier> expected_tier) {

    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open manifest: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    auto result = load_from_string(buffer, expected_tier);
    if (result.success) {
        result.manifest.source = path;
    } else {
        result.error_message = std::format("{}: {}", path, result.error_message);
    }
    return result;
}

// ============================================================================
// Public API - Load from string
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_string(
    const std::string& toml_content, std::optional<Tier> expected_tier) {

    try {
        auto tbl = toml::parse(toml_content);
        PolicyManifest manifest;
        manifest.source = "<string>";

        const std::string tier_str = tbl[kTier].value_or(""s);
        const auto tier = parse_tier(tier_str);
        if (!tier) {
            return LoadResult::error(std::format("Invalid or missing tier '{}'", tier_str));
        }
        if (expected_tier && *tier != *expected_tier) {
            return LoadResult::error(std::format("Manifest declares tier {} but is configured for {}",
                tier_to_string(*tier), tier_to_string(*expected_tier)));
        }
        manifest.tier = *tier;

        manifest.version = tbl[kVersion].value_or(""s);
        if (manifest.version.empty()) {
            return LoadResult::error("Manifest must have a version");
        }

        if (auto def = tbl[kDefaultAction].value<std::string>()) {
            const auto action = parse_action(*def);
            if (!action) {
                return LoadResult::error(std::format("Invalid default_action '{}'", *def));
            }
            manifest.default_action = *action;
        }

        if (const auto* labels = tbl[kLabels].as_table()) {
            for (const auto& [key, node] : *labels) {
                const std::string label = utils::to_upper(key.str());
                const auto* entry = node.as_table();
                if (!entry) {
                    return LoadResult::error(std::format("labels.{} must be a table", label));
                }

                LabelRule rule;
                rule.enabled = (*entry)["enabled"].value_or(true);

                const auto action_str = (*entry)["action"].value<std::string>();
                if (!action_str) {
                    return LoadResult::error(std::format("labels.{} has no action", label));
                }
                const auto action = parse_action(*action_str);
                if (!action) {
                    return LoadResult::error(
                        std::format("labels.{}: invalid action '{}'", label, *action_str));
                }
                rule.action = *action;
                manifest.labels[label] = rule;
            }
        }

        return LoadResult::ok(std::move(manifest));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error parsing manifest: {}", e.what()));
    }
}

// ============================================================================
// Public API - Load every tier
// ============================================================================

PolicyLoader::SetLoadResult PolicyLoader::load_set(const std::map<Tier, std::string>& paths) {
    SetLoadResult out;
    for (const auto& [tier, path] : paths) {
        auto result = load_from_file(path, tier);
        if (!result.success) {
            utils::log::error(std::format("Policy manifest for {} rejected: {}",
                tier_to_string(tier), result.error_message));
            out.errors.push_back(std::move(result.error_message));
            continue;
        }
        utils::log::info(std::format("Loaded {} manifest version {} ({} labels)",
            tier_to_string(tier), result.manifest.version, result.manifest.labels.size()));
        out.policies.manifests[tier] = std::move(result.manifest);
    }
    return out;
}

} // namespace redactguard
