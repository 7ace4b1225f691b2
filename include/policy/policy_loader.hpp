#pragma once

#include "policy/policy_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace redactguard {

/**
 * @brief Tier manifest loader from TOML
 *
 * Manifest layout:
 *   tier = "C4"
 *   version = "2025.1"
 *   default_action = "redact"     # optional
 *   [labels.IBAN]
 *   enabled = true
 *   action = "redact"
 *
 * Validates tier, version, every action string and that a file loaded for
 * tier X declares tier X.
 */
class PolicyLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PolicyManifest manifest;

        static LoadResult ok(PolicyManifest m) {
            LoadResult result;
            result.success = true;
            result.manifest = std::move(m);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Result of loading every configured tier
     *
     * Tiers whose manifest failed are absent from `policies` and listed in
     * `errors`; lookups at those tiers fail closed.
     */
    struct SetLoadResult {
        PolicySet policies;
        std::vector<std::string> errors;

        [[nodiscard]] bool complete() const { return errors.empty(); }
    };

    /**
     * @brief Load one manifest file
     * @param expected_tier If set, the file must declare this tier
     */
    [[nodiscard]] static LoadResult load_from_file(
        const std::string& path,
        std::optional<Tier> expected_tier = std::nullopt);

    [[nodiscard]] static LoadResult load_from_string(
        const std::string& toml_content,
        std::optional<Tier> expected_tier = std::nullopt);

    /// Load one manifest per configured tier
    [[nodiscard]] static SetLoadResult load_set(const std::map<Tier, std::string>& paths);
};

} // namespace redactguard
