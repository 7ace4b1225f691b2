#pragma once

#include "audit/audit_ledger.hpp"
#include "config/config_types.hpp"
#include "core/scrub_pipeline.hpp"
#include "fusion/recognition_model.hpp"
#include "receipt/receipt_metrics.hpp"
#include "reversal/descrub_engine.hpp"
#include "security/identifier_generator.hpp"

#include <memory>
#include <stop_token>
#include <string>

namespace redactguard {

/**
 * @brief Wires every component from a RedactConfig
 *
 * Owns the SecretConfig the identifier generator refers to, the shared
 * ledger, and both engines. The recognition model is injected by the
 * embedding application; with external_model.enabled = false it is ignored.
 */
class Service {
public:
    struct BuildResult {
        bool success = false;
        std::string error_message;
        std::unique_ptr<Service> service;

        static BuildResult ok(std::unique_ptr<Service> s) {
            BuildResult result;
            result.success = true;
            result.service = std::move(s);
            return result;
        }

        static BuildResult error(std::string message) {
            BuildResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static BuildResult build(const RedactConfig& config,
                                           std::shared_ptr<IRecognitionModel> model = nullptr);

    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    [[nodiscard]] Result<ScrubResult> scrub(const ScrubRequest& request,
                                            std::stop_token stop = {}) const;
    [[nodiscard]] Result<ScrubResult> scrub_cells(const CellScrubRequest& request,
                                                  std::stop_token stop = {}) const;
    [[nodiscard]] Result<DeScrubResult> descrub(const DeScrubRequest& request) const;

    [[nodiscard]] VerificationReport verify_ledger() const;

    /// Label/action counts and latency percentiles over the last `limit` receipts
    [[nodiscard]] ReceiptMetrics receipt_metrics(size_t limit = 2000) const;

    /// Re-read every configured manifest; the old set stays active on any failure
    [[nodiscard]] Result<void> reload_policies();

    [[nodiscard]] const AuditLedger& ledger() const { return *ledger_; }
    [[nodiscard]] const PolicyEngine& policy() const { return *policy_; }

    void shutdown();

private:
    explicit Service(const RedactConfig& config);

    RedactConfig config_;
    std::unique_ptr<SecretConfig> secret_;
    std::shared_ptr<PolicyEngine> policy_;
    std::shared_ptr<AuditLedger> ledger_;
    std::shared_ptr<IReceiptStore> receipts_;
    std::unique_ptr<ScrubPipeline> scrubber_;
    std::unique_ptr<DeScrubEngine> reverser_;
};

/// Detector set after [detectors] overrides, disables and custom rules
[[nodiscard]] Result<std::shared_ptr<DetectorRegistry>> build_detectors(const DetectorsConfig& config);

/// FusionSettings::defaults() with [fusion] and [external_model] applied
[[nodiscard]] FusionSettings build_fusion_settings(const RedactConfig& config);

/// "env:VAR" -> EnvKeyManager, "file:path" -> LocalKeyManager
[[nodiscard]] Result<std::shared_ptr<IKeyManager>> build_key_manager(const std::string& key_source);

} // namespace redactguard
