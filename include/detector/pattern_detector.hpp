#pragma once

#include "core/types.hpp"
#include "detector/validators.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace redactguard {

/**
 * @brief Detector capability: one label, pure scan over a content unit
 *
 * Implementations hold no mutable state; scan() may be called from any
 * number of threads at once.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual const std::string& id() const = 0;
    [[nodiscard]] virtual const std::string& label() const = 0;

    /// Spans are offsets into `content`; no cell coordinate is attached here
    [[nodiscard]] virtual std::vector<CandidateEntity> scan(std::string_view content) const = 0;
};

/// What happens to a shape match that fails its validity check
enum class InvalidMatchPolicy : uint8_t {
    DROP,       // Not emitted at all
    DEMOTE      // Emitted with validated=false and reduced confidence
};

struct PatternRule {
    std::string id;                     // e.g. "IBAN_basic"
    std::string label;                  // e.g. "IBAN"
    std::string pattern;                // ECMAScript regex
    validators::Validator validator;    // empty = shape only
    double confidence = 0.8;
    Tier tier = Tier::C3;
    InvalidMatchPolicy on_invalid = InvalidMatchPolicy::DROP;
    bool case_insensitive = false;
};

/**
 * @brief Regex shape + optional checksum detector
 *
 * The regex is compiled once at construction. Confidence is the rule's fixed
 * constant; matches failing validation are dropped or demoted to
 * confidence * kDemotionFactor depending on the rule.
 *
 * std::regex recurses per character consumed, so the regex only ever sees
 * segments whose whitespace-delimited tokens are at most kMaxTokenBytes long.
 * Longer tokens (encoded blobs, hex dumps) are skipped whole.
 */
class PatternDetector : public IDetector {
public:
    static constexpr double kDemotionFactor = 0.5;
    static constexpr size_t kMaxTokenBytes = 512;

    /// @throws std::regex_error if the pattern does not compile
    explicit PatternDetector(PatternRule rule);

    [[nodiscard]] const std::string& id() const override { return rule_.id; }
    [[nodiscard]] const std::string& label() const override { return rule_.label; }
    [[nodiscard]] std::vector<CandidateEntity> scan(std::string_view content) const override;

    [[nodiscard]] const PatternRule& rule() const { return rule_; }

private:
    /// Regex pass over one segment; spans are shifted by `offset`
    void scan_segment(std::string_view segment, size_t offset,
                      std::vector<CandidateEntity>& out) const;

    PatternRule rule_;
    std::regex regex_;
};

} // namespace redactguard
