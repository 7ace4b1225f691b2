#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"
#include "core/service.hpp"
#include "security/local_key_manager.hpp"
#include "mocks/pipeline_fixture.hpp"
#include "mocks/tmp_dir.hpp"

#include <cstdlib>
#include <filesystem>

using namespace redactguard;
using namespace redactguard::testing;

namespace {

constexpr const char* kMinimal = R"(
[identifiers]
salt = "unit-test-salt"

[policy.tiers]
C1 = "policy/c1.toml"
C3 = "policy/c3.toml"
)";

bool mentions(const std::string& message, const std::string& needle) {
    return message.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Defaults and sections
// ============================================================================

TEST_CASE("Minimal config takes defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.salt == "unit-test-salt");
    CHECK(cfg.policy_files.size() == 2);
    CHECK(cfg.policy_files.at(Tier::C3) == "policy/c3.toml");
    CHECK(cfg.encryption.key_source == "env:REDACTGUARD_RECEIPT_KEY");
    CHECK(cfg.receipts.mode == ReceiptMode::REQUIRED);
    CHECK(cfg.fusion.mode.mode == FusionMode::MAX);
    CHECK_FALSE(cfg.external_model.enabled);
    CHECK(cfg.external_model.timeout == std::chrono::milliseconds(250));
    CHECK(cfg.external_model.max_in_flight == 4);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.roles.empty());
}

TEST_CASE("Environment variables expand inside strings", "[config]") {
    ::setenv("REDACTGUARD_TEST_SALT", "salt-from-env", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[identifiers]
salt = "${REDACTGUARD_TEST_SALT}"
[policy.tiers]
C1 = "c1.toml"
)");
    ::unsetenv("REDACTGUARD_TEST_SALT");
    REQUIRE(result.success);
    CHECK(result.config.salt == "salt-from-env");
}

TEST_CASE("Unset salt variable leaves the salt empty and fails", "[config]") {
    ::unsetenv("REDACTGUARD_TEST_SALT_UNSET");
    const auto result = ConfigLoader::load_from_string(R"(
[identifiers]
salt = "${REDACTGUARD_TEST_SALT_UNSET}"
[policy.tiers]
C1 = "c1.toml"
)");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "identifiers.salt"));
}

TEST_CASE("Model thresholds accept numbers and per-label tables", "[config]") {
    const auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[external_model]
enabled = true
name = "ner-small"
timeout_ms = 40
max_in_flight = 2
accept_model_only = true
[external_model.thresholds]
C1 = 0.9
[external_model.thresholds.C2]
name = 0.8
ORG_NAME = 0.85
)");
    REQUIRE(result.success);
    const auto& m = result.config.external_model;
    CHECK(m.enabled);
    CHECK(m.accept_model_only);
    CHECK(m.timeout == std::chrono::milliseconds(40));
    CHECK(m.max_in_flight == 2);
    CHECK(m.thresholds.at(Tier::C1).at("*") == Catch::Approx(0.9));
    CHECK(m.thresholds.at(Tier::C2).at("NAME") == Catch::Approx(0.8));
    CHECK(m.thresholds.at(Tier::C2).at("ORG_NAME") == Catch::Approx(0.85));

    const auto settings = build_fusion_settings(result.config);
    CHECK(settings.accept_model_only);
    CHECK(settings.model_thresholds.at(Tier::C2).at("NAME") == Catch::Approx(0.8));
}

TEST_CASE("Fusion mode parses weighted and falls back on unknown", "[config]") {
    auto weighted = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[fusion]
mode = "weighted:0.6"
label_priority = ["iban", "email"]
)");
    REQUIRE(weighted.success);
    CHECK(weighted.config.fusion.mode.mode == FusionMode::WEIGHTED);
    CHECK(weighted.config.fusion.mode.weight == Catch::Approx(0.6));
    CHECK(weighted.config.fusion.label_priority == std::vector<std::string>{"IBAN", "EMAIL"});

    auto unknown = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[fusion]
mode = "median"
)");
    REQUIRE(unknown.success);
    CHECK(unknown.config.fusion.mode.mode == FusionMode::MAX);
}

TEST_CASE("Roles, receipts and custom detectors", "[config]") {
    const auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[roles]
analyst = "C2"
compliance_officer = "c4"

[receipts]
mode = "none"

[detectors]
disabled = ["dob"]
[detectors.tiers]
ipv4 = "C2"
[[detectors.custom]]
id = "TICKET_internal"
label = "ticket"
pattern = 'TCK-\d{6}'
confidence = 0.7
tier = "C2"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.roles.at("analyst") == Tier::C2);
    CHECK(cfg.roles.at("compliance_officer") == Tier::C4);
    CHECK(cfg.receipts.mode == ReceiptMode::NONE);
    CHECK(cfg.detectors.disabled_labels == std::vector<std::string>{"DOB"});
    CHECK(cfg.detectors.tier_overrides.at("IPV4") == Tier::C2);
    REQUIRE(cfg.detectors.custom.size() == 1);
    CHECK(cfg.detectors.custom[0].label == "TICKET");
    CHECK(cfg.detectors.custom[0].tier == Tier::C2);

    auto registry = build_detectors(cfg.detectors);
    REQUIRE(registry.is_ok());
    const auto found = registry.value()->scan("see TCK-123456 from 10.0.0.1", std::nullopt);
    bool ticket = false;
    for (const auto& c : found) {
        CHECK(c.label != "DOB");
        if (c.label == "TICKET") ticket = true;
        if (c.label == "IPV4") CHECK(c.tier == Tier::C2);
    }
    CHECK(ticket);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Every validation problem is reported together", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[identifiers]
salt = ""
[policy.tiers]
C9 = "c9.toml"
[external_model.thresholds]
C1 = 1.5
[encryption]
key_source = "vault:receipts"
[receipts]
mode = "sometimes"
[roles]
analyst = "C7"
[logging]
level = "chatty"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(mentions(msg, "Config validation failed:"));
    CHECK(mentions(msg, "identifiers.salt"));
    CHECK(mentions(msg, "'C9' is not a tier"));
    CHECK(mentions(msg, "external_model.thresholds.C1"));
    CHECK(mentions(msg, "encryption.key_source"));
    CHECK(mentions(msg, "receipts.mode"));
    CHECK(mentions(msg, "roles.analyst"));
    CHECK(mentions(msg, "logging.level"));
}

TEST_CASE("Config without policy manifests is rejected", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[identifiers]
salt = "s"
)");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "policy.tiers"));
}

TEST_CASE("Malformed TOML reports a parse failure", "[config]") {
    const auto result = ConfigLoader::load_from_string("[identifiers\nsalt = ");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "Failed to parse config"));
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("File config resolves includes and relative paths", "[config]") {
    TmpDir tmp("redactguard_config");
    tmp.file("shared/base.toml", R"(
[identifiers]
salt = "base-salt"
[roles]
analyst = "C2"
[logging]
level = "warn"
)");
    const auto main_path = tmp.file("redactguard.toml", R"(
include = ["shared/base.toml"]
[logging]
level = "debug"
[policy.tiers]
C3 = "policy/c3.toml"
[encryption]
key_source = "file:keys/receipt.keys"
[receipts]
dir = "data/receipts"
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.salt == "base-salt");
    CHECK(cfg.roles.at("analyst") == Tier::C2);
    CHECK(cfg.logging.level == "debug");

    namespace fs = std::filesystem;
    CHECK(fs::path(cfg.policy_files.at(Tier::C3)) == (tmp.path / "policy/c3.toml").lexically_normal());
    CHECK(cfg.encryption.key_source == "file:" + (tmp.path / "keys/receipt.keys").lexically_normal().string());
    CHECK(fs::path(cfg.receipts.dir).is_absolute());
}

TEST_CASE("Missing config file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/redactguard.toml");
    REQUIRE_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

// ============================================================================
// Service wiring
// ============================================================================

TEST_CASE("Service built from files scrubs, reverses and reloads", "[config][service]") {
    TmpDir tmp("redactguard_service");
    tmp.file("policy/c1.toml", kManifestC1);
    tmp.file("policy/c2.toml", kManifestC2);
    tmp.file("policy/c3.toml", kManifestC3);
    tmp.file("policy/c4.toml", kManifestC4);
    {
        LocalKeyManager keys(tmp.sub("keys/receipt.keys"));
        REQUIRE(keys.generate_and_add_key());
    }
    const auto config_path = tmp.file("redactguard.toml", R"(
[identifiers]
salt = "service-salt"
[policy.tiers]
C1 = "policy/c1.toml"
C2 = "policy/c2.toml"
C3 = "policy/c3.toml"
C4 = "policy/c4.toml"
[encryption]
key_source = "file:keys/receipt.keys"
[receipts]
dir = "data/receipts"
[audit]
ledger_file = "data/audit/ledger.jsonl"
[roles]
compliance_officer = "C4"
[logging]
level = "error"
)");

    const auto loaded = ConfigLoader::load_from_file(config_path);
    REQUIRE(loaded.success);
    auto built = Service::build(loaded.config);
    REQUIRE(built.success);
    auto& svc = *built.service;
    CHECK(svc.policy().manifest_count() == 4);

    ScrubRequest request;
    request.content = "IBAN BE71 0961 2345 6769";
    request.actor = "alice";
    request.session_id = "sess-1";
    request.requested_tier = Tier::C3;
    auto scrubbed = svc.scrub(request);
    REQUIRE(scrubbed.is_ok());
    CHECK(scrubbed.value().content.starts_with("IBAN C4::IBAN::"));
    CHECK(std::filesystem::exists(
        tmp.path / "data/receipts" / (scrubbed.value().operation_id + ".json")));

    DeScrubRequest reversal;
    reversal.operation_id = scrubbed.value().operation_id;
    reversal.actor = "bob";
    reversal.role = "compliance_officer";
    reversal.justification = "dispute";
    auto reversed = svc.descrub(reversal);
    REQUIRE(reversed.is_ok());
    CHECK(reversed.value().outcome == DeScrubOutcome::GRANTED);
    CHECK(*reversed.value().content == request.content);

    CHECK(svc.ledger().size() == 2);
    CHECK(svc.verify_ledger().ok);

    SECTION("Reload keeps the old set when a manifest is broken") {
        tmp.file("policy/c2.toml", "tier = \"C3\"\nversion = \"t2\"\n");
        auto reloaded = svc.reload_policies();
        REQUIRE(reloaded.is_error());
        CHECK(reloaded.error_category() == ErrorCategory::POLICY_CONFIG_ERROR);
        CHECK(svc.policy().manifest_count() == 4);
    }
    SECTION("Reload swaps in edited manifests") {
        tmp.file("policy/c3.toml", "tier = \"C3\"\nversion = \"t2\"\ndefault_action = \"redact\"\n");
        REQUIRE(svc.reload_policies().is_ok());
        CHECK(svc.policy().snapshot()->version().find("C3:t2") != std::string::npos);
    }
}
