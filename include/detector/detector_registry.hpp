#pragma once

#include "core/types.hpp"
#include "detector/pattern_detector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace redactguard {

/**
 * @brief Owns the enabled detector set and fans a content unit out to it
 *
 * Built-in families (label, tier, validator):
 * - EMAIL        C3  shape only
 * - PHONE        C3  shape only
 * - IBAN         C4  mod-97, invalid dropped
 * - PAN          C4  Luhn, invalid dropped
 * - NATIONAL_ID  C4  Belgian register mod-97, invalid demoted
 * - SSN          C4  area/group/serial, invalid dropped
 * - BIC          C3  country code, invalid dropped
 * - IPV4         C3  octet range, invalid dropped
 * - DOB          C3  calendar date, invalid dropped
 *
 * Registration happens at startup; scan() is const and thread-safe.
 */
class DetectorRegistry {
public:
    /// Content at or above this size is scanned with one task per detector
    static constexpr size_t kParallelThreshold = 64 * 1024;

    DetectorRegistry() = default;

    /// Registry populated with every built-in rule
    [[nodiscard]] static DetectorRegistry with_defaults();

    /// Built-in rule definitions (also the base for config overrides)
    [[nodiscard]] static std::vector<PatternRule> default_rules();

    void add(std::shared_ptr<const IDetector> detector);

    /// Drop every detector for `label`. Returns number removed.
    size_t remove_label(const std::string& label);

    /**
     * @brief Run every detector over one content unit
     * @param cell Structural coordinate stamped onto every candidate span
     */
    [[nodiscard]] std::vector<CandidateEntity> scan(
        std::string_view content,
        const std::optional<CellCoordinate>& cell = std::nullopt) const;

    [[nodiscard]] size_t size() const { return detectors_.size(); }
    [[nodiscard]] std::vector<std::string> labels() const;

private:
    std::vector<std::shared_ptr<const IDetector>> detectors_;
};

} // namespace redactguard
