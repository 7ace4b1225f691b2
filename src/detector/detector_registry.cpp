#include "detector/detector_registry.hpp"

#include <algorithm>
#include <future>

namespace redactguard {

std::vector<PatternRule> DetectorRegistry::default_rules() {
    std::vector<PatternRule> rules;

    rules.push_back(PatternRule{
        "EMAIL_basic", "EMAIL",
        R"([A-Za-z0-9](?:[A-Za-z0-9._%+-]*[A-Za-z0-9])?@[A-Za-z0-9](?:[A-Za-z0-9.-]*[A-Za-z0-9])?\.[A-Za-z]{2,24})",
        {}, 0.98, Tier::C3, InvalidMatchPolicy::DROP, false});

    // International (+32 / 0032 prefix) or Belgian national trunk format
    rules.push_back(PatternRule{
        "PHONE_basic", "PHONE",
        R"((?:\+|\b00)\d{2,3}[ .-]?\(?\d{1,4}\)?(?:[ .-]?\d{2,4}){2,4}\b|\b0\d{2,3}[ /.-]\d{2,3}[ .-]?\d{2}[ .-]?\d{2}\b)",
        {}, 0.98, Tier::C3, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "IBAN_basic", "IBAN",
        R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)",
        validators::iban_mod97, 0.95, Tier::C4, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "PAN_luhn", "PAN",
        R"(\b\d(?:[ -]?\d){12,18}\b)",
        validators::luhn, 0.99, Tier::C4, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "NATIONAL_ID_be", "NATIONAL_ID",
        R"(\b\d{2}\.?\d{2}\.?\d{2}[-. ]?\d{3}\.?\d{2}\b)",
        validators::be_national_register, 0.90, Tier::C4, InvalidMatchPolicy::DEMOTE, false});

    rules.push_back(PatternRule{
        "SSN_us", "SSN",
        R"(\b\d{3}-\d{2}-\d{4}\b)",
        validators::us_ssn, 0.90, Tier::C4, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "BIC_basic", "BIC",
        R"(\b[A-Z]{6}[A-Z0-9]{2}(?:[A-Z0-9]{3})?\b)",
        validators::bic, 0.80, Tier::C3, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "IPV4_basic", "IPV4",
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
        validators::ipv4, 0.85, Tier::C3, InvalidMatchPolicy::DROP, false});

    rules.push_back(PatternRule{
        "DOB_date", "DOB",
        R"(\b(?:\d{4}[-/]\d{2}[-/]\d{2}|\d{2}[-/]\d{2}[-/]\d{4})\b)",
        validators::calendar_date, 0.80, Tier::C3, InvalidMatchPolicy::DROP, false});

    return rules;
}

DetectorRegistry DetectorRegistry::with_defaults() {
    DetectorRegistry registry;
    for (auto& rule : default_rules()) {
        registry.add(std::make_shared<PatternDetector>(std::move(rule)));
    }
    return registry;
}

void DetectorRegistry::add(std::shared_ptr<const IDetector> detector) {
    if (detector) {
        detectors_.push_back(std::move(detector));
    }
}

size_t DetectorRegistry::remove_label(const std::string& label) {
    const auto before = detectors_.size();
    std::erase_if(detectors_, [&](const auto& d) { return d->label() == label; });
    return before - detectors_.size();
}

std::vector<std::string> DetectorRegistry::labels() const {
    std::vector<std::string> out;
    for (const auto& d : detectors_) {
        if (std::find(out.begin(), out.end(), d->label()) == out.end()) {
            out.push_back(d->label());
        }
    }
    return out;
}

std::vector<CandidateEntity> DetectorRegistry::scan(
    std::string_view content,
    const std::optional<CellCoordinate>& cell) const {

    std::vector<CandidateEntity> all;

    if (content.size() >= kParallelThreshold && detectors_.size() > 1) {
        std::vector<std::future<std::vector<CandidateEntity>>> futures;
        futures.reserve(detectors_.size());
        for (const auto& detector : detectors_) {
            futures.push_back(std::async(std::launch::async,
                [&detector, content]() { return detector->scan(content); }));
        }
        // Collected in registration order so output is independent of scheduling
        for (auto& f : futures) {
            auto part = f.get();
            all.insert(all.end(), std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
        }
    } else {
        for (const auto& detector : detectors_) {
            auto part = detector->scan(content);
            all.insert(all.end(), std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
        }
    }

    if (cell) {
        for (auto& c : all) {
            c.span.cell = cell;
        }
    }
    return all;
}

} // namespace redactguard
