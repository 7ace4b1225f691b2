#pragma once

#include "audit/audit_ledger.hpp"
#include "audit/memory_sink.hpp"
#include "core/scrub_pipeline.hpp"
#include "mocks/mock_key_manager.hpp"
#include "policy/policy_loader.hpp"
#include "receipt/receipt_store.hpp"
#include "reversal/descrub_engine.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace redactguard::testing {

// Contact details are masked at C3, everything else is redacted
inline constexpr const char* kManifestC1 = R"(
tier = "C1"
version = "t1"
default_action = "redact"
)";

inline constexpr const char* kManifestC2 = R"(
tier = "C2"
version = "t1"
default_action = "redact"
)";

inline constexpr const char* kManifestC3 = R"(
tier = "C3"
version = "t1"
default_action = "redact"
[labels.EMAIL]
action = "mask"
[labels.PHONE]
action = "mask"
[labels.IPV4]
enabled = false
action = "redact"
)";

inline constexpr const char* kManifestC4 = R"(
tier = "C4"
version = "t1"
default_action = "redact"
[labels.IBAN]
action = "redact"
[labels.PAN]
action = "redact"
)";

inline PolicySet test_policies() {
    PolicySet set;
    const std::pair<Tier, const char*> manifests[] = {
        {Tier::C1, kManifestC1}, {Tier::C2, kManifestC2},
        {Tier::C3, kManifestC3}, {Tier::C4, kManifestC4}};
    for (const auto& [tier, text] : manifests) {
        auto loaded = PolicyLoader::load_from_string(text, tier);
        if (!loaded.success) {
            throw std::runtime_error("test manifest rejected: " + loaded.error_message);
        }
        set.manifests[tier] = std::move(loaded.manifest);
    }
    return set;
}

/**
 * @brief Scrub + reversal engines over in-memory storage
 *
 * `sink` stays valid for the fixture's lifetime (owned by `ledger`).
 */
class PipelineFixture {
public:
    explicit PipelineFixture(std::shared_ptr<IRecognitionModel> model = nullptr,
                             std::chrono::milliseconds model_timeout = std::chrono::milliseconds(250),
                             ReceiptMode receipt_mode = ReceiptMode::REQUIRED)
        : secret("fixture-salt"),
          keys(std::make_shared<MockKeyManager>()),
          receipts(std::make_shared<MemoryReceiptStore>()),
          policy(std::make_shared<PolicyEngine>(test_policies())) {
        auto owned_sink = std::make_unique<MemorySink>();
        sink = owned_sink.get();
        ledger = std::make_shared<AuditLedger>(std::move(owned_sink));
        cipher = std::make_shared<ReceiptCipher>(keys);

        ScrubComponents sc;
        sc.detectors = std::make_shared<DetectorRegistry>(DetectorRegistry::with_defaults());
        sc.recognizer = std::make_shared<BoundedRecognitionModel>(std::move(model), model_timeout);
        sc.fusion = std::make_shared<FusionEngine>();
        sc.policy = policy;
        sc.identifiers = std::make_shared<IdentifierGenerator>(secret);
        sc.cipher = cipher;
        sc.receipts = receipts;
        sc.ledger = ledger;
        sc.receipt_mode = receipt_mode;
        scrubber = std::make_unique<ScrubPipeline>(std::move(sc));

        DeScrubComponents dc;
        dc.receipts = receipts;
        dc.cipher = cipher;
        dc.ledger = ledger;
        dc.roles = std::make_shared<RoleRegistry>(std::unordered_map<std::string, Tier>{
            {"analyst", Tier::C2}, {"compliance_officer", Tier::C4}});
        reverser = std::make_unique<DeScrubEngine>(std::move(dc));
    }

    [[nodiscard]] Result<ScrubResult> scrub(const std::string& content, Tier tier) const {
        ScrubRequest request;
        request.content = content;
        request.actor = "alice";
        request.session_id = "sess-1";
        request.requested_tier = tier;
        return scrubber->scrub(request);
    }

    [[nodiscard]] DeScrubRequest full_reversal(const std::string& operation_id,
                                               std::optional<Tier> clearance) const {
        DeScrubRequest request;
        request.operation_id = operation_id;
        request.actor = "bob";
        request.session_id = "sess-2";
        request.role = "auditor";
        request.clearance = clearance;
        request.justification = "customer request";
        return request;
    }

    SecretConfig secret;
    std::shared_ptr<MockKeyManager> keys;
    std::shared_ptr<MemoryReceiptStore> receipts;
    std::shared_ptr<PolicyEngine> policy;
    std::shared_ptr<ReceiptCipher> cipher;
    MemorySink* sink = nullptr;
    std::shared_ptr<AuditLedger> ledger;
    std::unique_ptr<ScrubPipeline> scrubber;
    std::unique_ptr<DeScrubEngine> reverser;
};

} // namespace redactguard::testing
