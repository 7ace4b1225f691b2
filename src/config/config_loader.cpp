#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detector/validators.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace redactguard {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * An unset variable expands to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays append.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty()) return path;
    const std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

/// Reads one tier-keyed value, recording an error for an unknown tier
std::optional<Tier> tier_key(std::string_view key, std::string_view section,
                             std::vector<std::string>& errors) {
    auto tier = parse_tier(key);
    if (!tier) {
        errors.push_back(std::format("{}: '{}' is not a tier (C1..C4)", section, key));
    }
    return tier;
}

std::optional<Tier> tier_value(const toml::node& node, std::string_view where,
                               std::vector<std::string>& errors) {
    const auto text = node.value<std::string>();
    if (!text) {
        errors.push_back(std::format("{} must be a tier string", where));
        return std::nullopt;
    }
    auto tier = parse_tier(*text);
    if (!tier) {
        errors.push_back(std::format("{}: '{}' is not a tier (C1..C4)", where, *text));
    }
    return tier;
}

// ---- Sections --------------------------------------------------------------

void extract_identifiers(const toml::table& root, RedactConfig& cfg,
                         std::vector<std::string>& errors) {
    cfg.salt = root["identifiers"]["salt"].value_or(""s);
    if (cfg.salt.empty()) {
        errors.push_back("identifiers.salt must not be empty");
    }
}

void extract_detectors(const toml::table& root, RedactConfig& cfg,
                       std::vector<std::string>& errors) {
    const auto* det = root["detectors"].as_table();
    if (!det) return;

    for (const auto& label : toml_string_array(*det, "disabled")) {
        cfg.detectors.disabled_labels.push_back(utils::to_upper(label));
    }

    if (const auto* tiers = (*det)["tiers"].as_table()) {
        for (const auto& [label, node] : *tiers) {
            const auto where = std::format("detectors.tiers.{}", label.str());
            if (auto tier = tier_value(node, where, errors)) {
                cfg.detectors.tier_overrides[utils::to_upper(label.str())] = *tier;
            }
        }
    }

    const auto* custom = (*det)["custom"].as_array();
    if (!custom) return;

    size_t index = 0;
    for (const auto& elem : *custom) {
        const auto where = std::format("detectors.custom[{}]", index++);
        const auto* t = elem.as_table();
        if (!t) {
            errors.push_back(std::format("{} must be a table", where));
            continue;
        }

        CustomRuleConfig rule;
        rule.id = (*t)["id"].value_or(""s);
        rule.label = utils::to_upper((*t)["label"].value_or(""s));
        rule.pattern = (*t)["pattern"].value_or(""s);
        rule.validator = (*t)["validator"].value_or("none"s);
        rule.confidence = (*t)["confidence"].value_or(0.8);
        rule.case_insensitive = (*t)["case_insensitive"].value_or(false);

        if (rule.id.empty() || rule.label.empty() || rule.pattern.empty()) {
            errors.push_back(std::format("{}: id, label and pattern are required", where));
        }
        if (rule.confidence < 0.0 || rule.confidence > 1.0) {
            errors.push_back(std::format("{}.confidence must be in [0,1]", where));
        }
        if (!validators::find(rule.validator)) {
            errors.push_back(std::format("{}.validator: unknown validator '{}'", where, rule.validator));
        }
        if (const auto* tier_node = (*t)["tier"].node()) {
            if (auto tier = tier_value(*tier_node, where + ".tier", errors)) {
                rule.tier = *tier;
            }
        }
        const std::string on_invalid = utils::to_lower((*t)["on_invalid"].value_or("drop"s));
        if (on_invalid == "drop") {
            rule.on_invalid = InvalidMatchPolicy::DROP;
        } else if (on_invalid == "demote") {
            rule.on_invalid = InvalidMatchPolicy::DEMOTE;
        } else {
            errors.push_back(std::format("{}.on_invalid must be 'drop' or 'demote'", where));
        }
        cfg.detectors.custom.push_back(std::move(rule));
    }
}

void extract_external_model(const toml::table& root, RedactConfig& cfg,
                            std::vector<std::string>& errors) {
    const auto* ext = root["external_model"].as_table();
    if (!ext) return;
    auto& m = cfg.external_model;

    m.enabled = (*ext)["enabled"].value_or(false);
    m.name = (*ext)["name"].value_or("none"s);
    m.accept_model_only = (*ext)["accept_model_only"].value_or(false);

    const int64_t timeout_ms = (*ext)["timeout_ms"].value_or(int64_t{250});
    if (timeout_ms <= 0) {
        errors.push_back("external_model.timeout_ms must be > 0");
    } else {
        m.timeout = std::chrono::milliseconds(timeout_ms);
    }

    const int64_t max_in_flight = (*ext)["max_in_flight"].value_or(int64_t{4});
    if (max_in_flight <= 0) {
        errors.push_back("external_model.max_in_flight must be > 0");
    } else {
        m.max_in_flight = static_cast<size_t>(max_in_flight);
    }

    const auto* thresholds = (*ext)["thresholds"].as_table();
    if (!thresholds) return;

    for (const auto& [key, node] : *thresholds) {
        const auto tier = tier_key(key.str(), "external_model.thresholds", errors);
        if (!tier) continue;

        const auto check = [&](std::string_view label, std::optional<double> value) {
            if (!value || *value < 0.0 || *value > 1.0) {
                errors.push_back(std::format("external_model.thresholds.{}.{} must be a number in [0,1]",
                    key.str(), label));
                return;
            }
            m.thresholds[*tier][std::string(label)] = *value;
        };

        if (const auto* per_label = node.as_table()) {
            for (const auto& [label, v] : *per_label) {
                check(utils::to_upper(label.str()), v.value<double>());
            }
        } else {
            check(FusionSettings::kAnyLabel, node.value<double>());
        }
    }
}

void extract_fusion(const toml::table& root, RedactConfig& cfg) {
    const auto* fusion = root["fusion"].as_table();
    if (!fusion) return;

    const std::string mode = (*fusion)["mode"].value_or("max"s);
    if (auto spec = FusionEngine::parse_mode(mode)) {
        cfg.fusion.mode = *spec;
    } else {
        utils::log::warn(std::format("fusion.mode '{}' not recognised, using max", mode));
        cfg.fusion.mode = FusionModeSpec{};
    }

    for (const auto& label : toml_string_array(*fusion, "label_priority")) {
        cfg.fusion.label_priority.push_back(utils::to_upper(label));
    }
}

void extract_policy(const toml::table& root, const std::string& base_dir,
                    RedactConfig& cfg, std::vector<std::string>& errors) {
    const auto* tiers = root["policy"]["tiers"].as_table();
    if (!tiers || tiers->empty()) {
        errors.push_back("policy.tiers must name at least one manifest");
        return;
    }
    for (const auto& [key, node] : *tiers) {
        const auto tier = tier_key(key.str(), "policy.tiers", errors);
        if (!tier) continue;
        const auto path = node.value<std::string>();
        if (!path || path->empty()) {
            errors.push_back(std::format("policy.tiers.{} must be a file path", key.str()));
            continue;
        }
        cfg.policy_files[*tier] = resolve_path(*path, base_dir);
    }
}

void extract_encryption(const toml::table& root, const std::string& base_dir,
                        RedactConfig& cfg, std::vector<std::string>& errors) {
    std::string source = root["encryption"]["key_source"].value_or(cfg.encryption.key_source);
    if (source.starts_with("file:")) {
        source = "file:" + resolve_path(source.substr(5), base_dir);
    } else if (!source.starts_with("env:")) {
        errors.push_back(std::format("encryption.key_source must start with 'env:' or 'file:', got '{}'",
            source));
    }
    if (source == "env:" || source == "file:") {
        errors.push_back("encryption.key_source names no variable or file");
    }
    cfg.encryption.key_source = std::move(source);
}

void extract_storage(const toml::table& root, const std::string& base_dir,
                     RedactConfig& cfg, std::vector<std::string>& errors) {
    const std::string mode = utils::to_lower(root["receipts"]["mode"].value_or("required"s));
    if (mode == "required") {
        cfg.receipts.mode = ReceiptMode::REQUIRED;
    } else if (mode == "none") {
        cfg.receipts.mode = ReceiptMode::NONE;
    } else {
        errors.push_back(std::format("receipts.mode must be 'required' or 'none', got '{}'", mode));
    }
    cfg.receipts.dir = resolve_path(root["receipts"]["dir"].value_or(cfg.receipts.dir), base_dir);
    cfg.audit.ledger_file = resolve_path(
        root["audit"]["ledger_file"].value_or(cfg.audit.ledger_file), base_dir);
    if (cfg.audit.ledger_file.empty()) {
        errors.push_back("audit.ledger_file must not be empty");
    }
}

void extract_roles(const toml::table& root, RedactConfig& cfg,
                   std::vector<std::string>& errors) {
    const auto* roles = root["roles"].as_table();
    if (!roles) return;
    for (const auto& [name, node] : *roles) {
        if (auto tier = tier_value(node, std::format("roles.{}", name.str()), errors)) {
            cfg.roles[std::string(name.str())] = *tier;
        }
    }
}

void extract_logging(const toml::table& root, RedactConfig& cfg,
                     std::vector<std::string>& errors) {
    cfg.logging.level = root["logging"]["level"].value_or(cfg.logging.level);
    if (!utils::log::parse_level(cfg.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not debug/info/warn/error",
            cfg.logging.level));
    }
}

void extract_limits(const toml::table& root, RedactConfig& cfg,
                    std::vector<std::string>& errors) {
    const int64_t max_bytes = root["limits"]["max_content_bytes"].value_or(
        static_cast<int64_t>(cfg.limits.max_content_bytes));
    if (max_bytes <= 0) {
        errors.push_back("limits.max_content_bytes must be > 0");
        return;
    }
    cfg.limits.max_content_bytes = static_cast<size_t>(max_bytes);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::extract_all_sections(const toml::table& root,
                                                            const std::string& base_dir) {
    RedactConfig config;
    std::vector<std::string> errors;

    extract_identifiers(root, config, errors);
    extract_detectors(root, config, errors);
    extract_external_model(root, config, errors);
    extract_fusion(root, config);
    extract_policy(root, base_dir, config, errors);
    extract_encryption(root, base_dir, config, errors);
    extract_storage(root, base_dir, config, errors);
    extract_roles(root, config, errors);
    extract_logging(root, config, errors);
    extract_limits(root, config, errors);

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
        return extract_all_sections(tbl, base_dir);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config {}: {}",
            config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_all_sections(tbl, "");
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace redactguard
