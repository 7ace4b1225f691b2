#pragma once

#include "core/types.hpp"
#include "detector/pattern_detector.hpp"
#include "fusion/fusion_engine.hpp"
#include "receipt/receipt.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace redactguard {

// ============================================================================
// Detector Config
// ============================================================================

/// Rule declared in [[detectors.custom]]; validator named, not bound yet
struct CustomRuleConfig {
    std::string id;
    std::string label;
    std::string pattern;
    std::string validator = "none";
    double confidence = 0.8;
    Tier tier = Tier::C3;
    InvalidMatchPolicy on_invalid = InvalidMatchPolicy::DROP;
    bool case_insensitive = false;
};

struct DetectorsConfig {
    std::vector<std::string> disabled_labels;
    std::unordered_map<std::string, Tier> tier_overrides;
    std::vector<CustomRuleConfig> custom;
};

// ============================================================================
// External Model Config
// ============================================================================

struct ExternalModelConfig {
    bool enabled = false;
    std::string name = "none";
    std::chrono::milliseconds timeout{250};
    size_t max_in_flight = 4;           // Concurrent model threads, abandoned ones included
    bool accept_model_only = false;
    /// Per requested tier: label -> minimum score; a bare number is stored under "*"
    std::unordered_map<Tier, std::unordered_map<std::string, double>> thresholds;
};

// ============================================================================
// Remaining Sections
// ============================================================================

struct FusionConfig {
    FusionModeSpec mode;
    std::vector<std::string> label_priority;
};

struct EncryptionConfig {
    std::string key_source = "env:REDACTGUARD_RECEIPT_KEY";    // env:<VAR> | file:<path>
};

struct ReceiptsConfig {
    ReceiptMode mode = ReceiptMode::REQUIRED;
    std::string dir = "data/receipts";
};

struct AuditConfig {
    std::string ledger_file = "data/audit/ledger.jsonl";
};

struct LoggingConfig {
    std::string level = "info";
};

struct LimitsConfig {
    size_t max_content_bytes = 10 * 1024 * 1024;
};

// ============================================================================
// RedactConfig - Complete parsed configuration
// ============================================================================

struct RedactConfig {
    std::string salt;
    DetectorsConfig detectors;
    ExternalModelConfig external_model;
    FusionConfig fusion;
    std::map<Tier, std::string> policy_files;       // Resolved against the config directory
    EncryptionConfig encryption;
    ReceiptsConfig receipts;
    AuditConfig audit;
    std::unordered_map<std::string, Tier> roles;
    LoggingConfig logging;
    LimitsConfig limits;
};

} // namespace redactguard
