#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace redactguard {

/**
 * @brief Extract a typed RedactConfig from a TOML file
 *
 * - `${VAR}` in any string is replaced from the environment
 * - `include = ["other.toml"]` merges other files underneath (main file wins)
 * - Relative policy, receipt, ledger and key-file paths resolve against the
 *   directory of the main config file
 * - Every enum-like string (tier, action, mode) is validated; all problems
 *   are reported together
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RedactConfig config;

        static LoadResult ok(RedactConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /// Paths stay as written (relative to the working directory)
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

private:
    static LoadResult extract_all_sections(const toml::table& root,
                                           const std::string& base_dir);
};

} // namespace redactguard
