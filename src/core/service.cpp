#include "core/service.hpp"
#include "audit/file_sink.hpp"
#include "core/utils.hpp"
#include "detector/validators.hpp"
#include "policy/policy_loader.hpp"
#include "receipt/receipt_store.hpp"
#include "security/env_key_manager.hpp"
#include "security/local_key_manager.hpp"
#include "security/receipt_cipher.hpp"

#include <algorithm>
#include <format>
#include <regex>

namespace redactguard {

// ============================================================================
// Component builders
// ============================================================================

Result<std::shared_ptr<DetectorRegistry>> build_detectors(const DetectorsConfig& config) {
    std::vector<PatternRule> rules = DetectorRegistry::default_rules();

    for (const auto& custom : config.custom) {
        auto validator = validators::find(custom.validator);
        if (!validator) {
            return Result<std::shared_ptr<DetectorRegistry>>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Rule {}: unknown validator '{}'", custom.id, custom.validator));
        }
        PatternRule rule;
        rule.id = custom.id;
        rule.label = custom.label;
        rule.pattern = custom.pattern;
        rule.validator = std::move(*validator);
        rule.confidence = custom.confidence;
        rule.tier = custom.tier;
        rule.on_invalid = custom.on_invalid;
        rule.case_insensitive = custom.case_insensitive;
        rules.push_back(std::move(rule));
    }

    auto registry = std::make_shared<DetectorRegistry>();
    for (auto& rule : rules) {
        if (std::find(config.disabled_labels.begin(), config.disabled_labels.end(), rule.label)
                != config.disabled_labels.end()) {
            continue;
        }
        const auto override_it = config.tier_overrides.find(rule.label);
        if (override_it != config.tier_overrides.end()) {
            rule.tier = override_it->second;
        }

        const std::string id = rule.id;
        try {
            registry->add(std::make_shared<PatternDetector>(std::move(rule)));
        } catch (const std::regex_error& e) {
            return Result<std::shared_ptr<DetectorRegistry>>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Rule {}: pattern does not compile: {}", id, e.what()));
        }
    }

    for (const auto& label : config.disabled_labels) {
        utils::log::info(std::format("Detector label {} disabled by config", label));
    }
    return Result<std::shared_ptr<DetectorRegistry>>::ok(std::move(registry));
}

FusionSettings build_fusion_settings(const RedactConfig& config) {
    FusionSettings settings = FusionSettings::defaults();
    settings.mode = config.fusion.mode;
    if (!config.fusion.label_priority.empty()) {
        settings.label_priority = config.fusion.label_priority;
    }
    settings.accept_model_only = config.external_model.accept_model_only;
    for (const auto& [tier, labels] : config.external_model.thresholds) {
        for (const auto& [label, threshold] : labels) {
            settings.model_thresholds[tier][label] = threshold;
        }
    }
    return settings;
}

Result<std::shared_ptr<IKeyManager>> build_key_manager(const std::string& key_source) {
    if (key_source.starts_with("env:")) {
        return Result<std::shared_ptr<IKeyManager>>::ok(
            std::make_shared<EnvKeyManager>(key_source.substr(4)));
    }
    if (key_source.starts_with("file:")) {
        return Result<std::shared_ptr<IKeyManager>>::ok(
            std::make_shared<LocalKeyManager>(key_source.substr(5)));
    }
    return Result<std::shared_ptr<IKeyManager>>::error(ErrorCategory::VALIDATION_ERROR,
        std::format("Unsupported key source '{}'", key_source));
}

// ============================================================================
// Service
// ============================================================================

Service::Service(const RedactConfig& config)
    : config_(config),
      secret_(std::make_unique<SecretConfig>(config.salt)) {}

Service::~Service() {
    shutdown();
}

Service::BuildResult Service::build(const RedactConfig& config,
                                    std::shared_ptr<IRecognitionModel> model) {
    if (auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    if (config.salt.empty()) {
        return BuildResult::error("identifiers.salt must not be empty");
    }

    std::unique_ptr<Service> svc(new Service(config));

    auto detectors = build_detectors(config.detectors);
    if (detectors.is_error()) {
        return BuildResult::error(detectors.error_message());
    }

    const auto loaded = PolicyLoader::load_set(config.policy_files);
    if (!loaded.complete()) {
        utils::log::warn(std::format("{} policy manifest(s) rejected; those tiers fail closed",
            loaded.errors.size()));
    }
    svc->policy_ = std::make_shared<PolicyEngine>(loaded.policies);

    auto key_manager = build_key_manager(config.encryption.key_source);
    if (key_manager.is_error()) {
        return BuildResult::error(key_manager.error_message());
    }
    auto cipher = std::make_shared<ReceiptCipher>(key_manager.value());
    if (!cipher->available() && config.receipts.mode == ReceiptMode::REQUIRED) {
        utils::log::warn("No receipt key available; scrubs will fail with encryption_unavailable");
    }

    if (config.external_model.enabled && !model) {
        utils::log::warn(std::format("external_model '{}' enabled but no model supplied; running without it",
            config.external_model.name));
    }
    auto recognizer = std::make_shared<BoundedRecognitionModel>(
        config.external_model.enabled ? std::move(model) : nullptr,
        config.external_model.timeout,
        config.external_model.max_in_flight);

    try {
        svc->ledger_ = std::make_shared<AuditLedger>(
            std::make_unique<FileSink>(config.audit.ledger_file));
    } catch (const std::exception& e) {
        return BuildResult::error(std::format("Audit ledger: {}", e.what()));
    }

    auto receipts = std::make_shared<FileReceiptStore>(config.receipts.dir);
    svc->receipts_ = receipts;

    ScrubComponents sc;
    sc.detectors = detectors.value();
    sc.recognizer = std::move(recognizer);
    sc.fusion = std::make_shared<FusionEngine>(build_fusion_settings(config));
    sc.policy = svc->policy_;
    sc.identifiers = std::make_shared<IdentifierGenerator>(*svc->secret_);
    sc.cipher = cipher;
    sc.receipts = receipts;
    sc.ledger = svc->ledger_;
    sc.receipt_mode = config.receipts.mode;
    sc.max_content_bytes = config.limits.max_content_bytes;
    svc->scrubber_ = std::make_unique<ScrubPipeline>(std::move(sc));

    DeScrubComponents dc;
    dc.receipts = receipts;
    dc.cipher = cipher;
    dc.ledger = svc->ledger_;
    dc.roles = std::make_shared<RoleRegistry>(config.roles);
    svc->reverser_ = std::make_unique<DeScrubEngine>(std::move(dc));

    utils::log::info(std::format(
        "redactguard ready: {} detectors, policies [{}], receipts {}, ledger {}",
        detectors.value()->size(), svc->policy_->snapshot()->version(),
        config.receipts.mode == ReceiptMode::REQUIRED ? receipts->name() : "disabled",
        svc->ledger_->sink_name()));
    return BuildResult::ok(std::move(svc));
}

Result<ScrubResult> Service::scrub(const ScrubRequest& request, std::stop_token stop) const {
    return scrubber_->scrub(request, std::move(stop));
}

Result<ScrubResult> Service::scrub_cells(const CellScrubRequest& request,
                                         std::stop_token stop) const {
    return scrubber_->scrub_cells(request, std::move(stop));
}

Result<DeScrubResult> Service::descrub(const DeScrubRequest& request) const {
    return reverser_->descrub(request);
}

VerificationReport Service::verify_ledger() const {
    return ledger_->verify();
}

ReceiptMetrics Service::receipt_metrics(size_t limit) const {
    return summarize_receipts(*receipts_, limit);
}

Result<void> Service::reload_policies() {
    const auto loaded = PolicyLoader::load_set(config_.policy_files);
    if (!loaded.complete()) {
        std::string combined = "Policy reload rejected:";
        for (const auto& err : loaded.errors) { combined += "\n  - "; combined += err; }
        return Result<void>::error(ErrorCategory::POLICY_CONFIG_ERROR, std::move(combined));
    }
    policy_->reload(loaded.policies);
    utils::log::info(std::format("Policies reloaded: {}", loaded.policies.version()));
    return Result<void>::ok();
}

void Service::shutdown() {
    if (ledger_) {
        ledger_->shutdown();
    }
}

} // namespace redactguard
