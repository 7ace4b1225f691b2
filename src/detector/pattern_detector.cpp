#include "detector/pattern_detector.hpp"

namespace redactguard {

namespace {

std::regex compile(const PatternRule& rule) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (rule.case_insensitive) {
        flags |= std::regex::icase;
    }
    return std::regex(rule.pattern, flags);
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

PatternDetector::PatternDetector(PatternRule rule)
    : rule_(std::move(rule)), regex_(compile(rule_)) {}

std::vector<CandidateEntity> PatternDetector::scan(std::string_view content) const {
    std::vector<CandidateEntity> out;
    if (content.empty()) return out;

    // Segments end before an over-long token and resume after it
    size_t segment_start = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        if (is_space(content[pos])) {
            ++pos;
            continue;
        }
        size_t token_end = pos;
        while (token_end < content.size() && !is_space(content[token_end])) {
            ++token_end;
        }
        if (token_end - pos > kMaxTokenBytes) {
            scan_segment(content.substr(segment_start, pos - segment_start), segment_start, out);
            segment_start = token_end;
        }
        pos = token_end;
    }
    scan_segment(content.substr(segment_start), segment_start, out);
    return out;
}

void PatternDetector::scan_segment(std::string_view segment, size_t offset,
                                   std::vector<CandidateEntity>& out) const {
    if (segment.empty()) return;

    const char* begin = segment.data();
    const char* end = segment.data() + segment.size();

    for (std::cregex_iterator it(begin, end, regex_), last; it != last; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;

        const std::string_view matched(begin + m.position(0), static_cast<size_t>(m.length(0)));
        bool valid = true;
        if (rule_.validator) {
            valid = rule_.validator(matched);
        }
        if (!valid && rule_.on_invalid == InvalidMatchPolicy::DROP) {
            continue;
        }

        CandidateEntity c;
        c.label = rule_.label;
        c.span.start = offset + static_cast<size_t>(m.position(0));
        c.span.end = c.span.start + matched.size();
        c.confidence = valid ? rule_.confidence : rule_.confidence * kDemotionFactor;
        c.detector_id = rule_.id;
        c.rule_id = rule_.id;
        c.tier = rule_.tier;
        c.validated = valid;
        c.source = CandidateSource::PATTERN;
        out.push_back(std::move(c));
    }
}

} // namespace redactguard
