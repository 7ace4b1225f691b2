#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "detector/detector_registry.hpp"

#include <algorithm>
#include <iterator>
#include <regex>

using namespace redactguard;

namespace {

std::vector<CandidateEntity> with_label(const std::vector<CandidateEntity>& all,
                                        const std::string& label) {
    std::vector<CandidateEntity> out;
    std::copy_if(all.begin(), all.end(), std::back_inserter(out),
                 [&](const auto& c) { return c.label == label; });
    return out;
}

} // anonymous namespace

// ============================================================================
// Built-in families
// ============================================================================

TEST_CASE("Default registry carries every built-in family", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();
    CHECK(registry.size() == 9);

    const auto labels = registry.labels();
    for (const char* label : {"EMAIL", "PHONE", "IBAN", "PAN", "NATIONAL_ID",
                              "SSN", "BIC", "IPV4", "DOB"}) {
        CHECK(std::find(labels.begin(), labels.end(), label) != labels.end());
    }
}

TEST_CASE("Email is found with exact offsets", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();
    const auto found = registry.scan("mail jane.doe@example.org now");

    const auto emails = with_label(found, "EMAIL");
    REQUIRE(emails.size() == 1);
    CHECK(emails[0].span.start == 5);
    CHECK(emails[0].span.end == 25);
    CHECK(emails[0].confidence == Catch::Approx(0.98));
    CHECK(emails[0].tier == Tier::C3);
    CHECK(emails[0].rule_id == "EMAIL_basic");
    CHECK_FALSE(emails[0].span.cell.has_value());
}

TEST_CASE("Card numbers failing Luhn are dropped", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    const auto valid = with_label(registry.scan("card 4111 1111 1111 1111 exp"), "PAN");
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].span.start == 5);
    CHECK(valid[0].span.end == 24);
    CHECK(valid[0].tier == Tier::C4);
    CHECK(valid[0].validated);

    CHECK(with_label(registry.scan("card 4111 1111 1111 1112 exp"), "PAN").empty());
}

TEST_CASE("IBAN shape with a bad checksum is not emitted", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    const auto good = registry.scan("IBAN BE71 0961 2345 6769");
    REQUIRE(good.size() == 1);
    CHECK(good[0].label == "IBAN");
    CHECK(good[0].span.start == 5);
    CHECK(good[0].span.end == 24);
    CHECK(good[0].confidence == Catch::Approx(0.95));

    CHECK(registry.scan("IBAN BE71 0961 2345 6768").empty());
}

TEST_CASE("National register number failing its check is demoted, not dropped", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    const auto valid = with_label(registry.scan("NRN 85.07.30-033.28"), "NATIONAL_ID");
    REQUIRE(valid.size() == 1);
    CHECK(valid[0].validated);
    CHECK(valid[0].confidence == Catch::Approx(0.90));

    const auto demoted = with_label(registry.scan("NRN 85.07.30-033.29"), "NATIONAL_ID");
    REQUIRE(demoted.size() == 1);
    CHECK_FALSE(demoted[0].validated);
    CHECK(demoted[0].confidence == Catch::Approx(0.90 * PatternDetector::kDemotionFactor));
}

TEST_CASE("SSN, IPv4 and dates go through their validators", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    CHECK(with_label(registry.scan("ssn 123-45-6789"), "SSN").size() == 1);
    CHECK(with_label(registry.scan("ssn 666-45-6789"), "SSN").empty());

    CHECK(with_label(registry.scan("host 192.168.1.10 up"), "IPV4").size() == 1);
    CHECK(with_label(registry.scan("host 999.168.1.10 up"), "IPV4").empty());

    CHECK(with_label(registry.scan("born 1990-04-12"), "DOB").size() == 1);
    CHECK(with_label(registry.scan("born 1990-02-30"), "DOB").empty());
}

TEST_CASE("Empty content yields no candidates", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();
    CHECK(registry.scan("").empty());
    CHECK(registry.scan("nothing sensitive here").empty());
}

// ============================================================================
// Registry behaviour
// ============================================================================

TEST_CASE("Cell coordinate is stamped onto every candidate", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();
    const CellCoordinate at{"Sheet1", "B2"};

    const auto found = registry.scan("x@y.io", at);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].span.cell.has_value());
    CHECK(*found[0].span.cell == at);
}

TEST_CASE("remove_label drops a whole family", "[detectors]") {
    auto registry = DetectorRegistry::with_defaults();
    CHECK(registry.remove_label("EMAIL") == 1);
    CHECK(registry.remove_label("EMAIL") == 0);
    CHECK(registry.size() == 8);
    CHECK(registry.scan("jane@example.org").empty());
}

TEST_CASE("Large content is scanned per detector with identical results", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    std::string content(DetectorRegistry::kParallelThreshold, ' ');
    content += " jane@example.org 4111 1111 1111 1111";

    const auto found = registry.scan(content);
    const auto emails = with_label(found, "EMAIL");
    const auto pans = with_label(found, "PAN");
    REQUIRE(emails.size() == 1);
    REQUIRE(pans.size() == 1);
    CHECK(emails[0].span.start == DetectorRegistry::kParallelThreshold + 1);
    CHECK(pans[0].span.end == content.size());

    // Registration order: EMAIL is registered before PAN
    CHECK(found.front().label == "EMAIL");
}

TEST_CASE("Over-long tokens are skipped without losing nearby matches", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    const std::string blob(1'000'000, 'a');
    CHECK(registry.scan(blob).empty());

    const std::string prefix = "from jane@example.org ";
    const std::string content = prefix + blob + "@example.org\nreply bob@example.net";
    const auto emails = with_label(registry.scan(content), "EMAIL");
    REQUIRE(emails.size() == 2);
    CHECK(emails[0].span.start == 5);
    CHECK(emails[0].span.end == 21);
    CHECK(content.substr(emails[1].span.start, emails[1].span.end - emails[1].span.start) ==
          "bob@example.net");
}

TEST_CASE("Tokens up to the length bound are still scanned", "[detectors]") {
    const auto registry = DetectorRegistry::with_defaults();

    const std::string local(PatternDetector::kMaxTokenBytes - std::string("@example.org").size(), 'x');
    const std::string at_bound = local + "@example.org";
    REQUIRE(at_bound.size() == PatternDetector::kMaxTokenBytes);
    CHECK(with_label(registry.scan("to " + at_bound), "EMAIL").size() == 1);
    CHECK(with_label(registry.scan("to x" + at_bound), "EMAIL").empty());
}

// ============================================================================
// Custom rules
// ============================================================================

TEST_CASE("Custom case-insensitive rule without a validator", "[detectors]") {
    PatternRule rule;
    rule.id = "TICKET_ref";
    rule.label = "TICKET";
    rule.pattern = R"(tkt-\d{4})";
    rule.confidence = 0.7;
    rule.tier = Tier::C2;
    rule.case_insensitive = true;

    const PatternDetector detector(rule);
    const auto found = detector.scan("see TKT-1234 and tkt-9876");
    REQUIRE(found.size() == 2);
    CHECK(found[0].span.start == 4);
    CHECK(found[1].span.start == 17);
    CHECK(found[0].tier == Tier::C2);
    CHECK(found[0].detector_id == "TICKET_ref");
}

TEST_CASE("Pattern that does not compile throws at construction", "[detectors]") {
    PatternRule rule;
    rule.id = "broken";
    rule.label = "BROKEN";
    rule.pattern = "([a-z";
    CHECK_THROWS_AS(PatternDetector(rule), std::regex_error);
}
