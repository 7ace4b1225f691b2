#include <catch2/catch_test_macros.hpp>
#include "reversal/descrub_engine.hpp"
#include "mocks/pipeline_fixture.hpp"

#include <set>
#include <stdexcept>

using namespace redactguard;
using namespace redactguard::testing;

namespace {

constexpr const char* kIbanText = "IBAN BE71 0961 2345 6769";
constexpr const char* kMixedText =
    "Transfer from BE71 0961 2345 6769, contact john.doe@example.com or host 10.0.0.1";

std::string scrubbed_operation(PipelineFixture& fx, const std::string& content, Tier tier) {
    auto scrubbed = fx.scrub(content, tier);
    if (scrubbed.is_error()) {
        throw std::runtime_error("scrub failed: " + scrubbed.error_message());
    }
    return scrubbed.value().operation_id;
}

} // anonymous namespace

// ============================================================================
// Clearance gate
// ============================================================================

TEST_CASE("Sufficient clearance restores the original and is audited", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);

    auto reversed = fx.reverser->descrub(fx.full_reversal(op, Tier::C4));
    REQUIRE(reversed.is_ok());
    const auto& r = reversed.value();
    CHECK(r.outcome == DeScrubOutcome::GRANTED);
    REQUIRE(r.content.has_value());
    CHECK(*r.content == kIbanText);
    CHECK(r.required_tier == Tier::C4);
    CHECK(r.restored.size() == 1);

    REQUIRE(fx.ledger->size() == 2);
    const auto entry = fx.ledger->entries().back();
    CHECK(entry.event == AuditEvent::DESCRUB);
    CHECK(entry.outcome == AuditOutcome::GRANTED);
    CHECK(entry.operation_id == op);
    CHECK(entry.actor == "bob");
    CHECK(entry.tier == "C4");
    REQUIRE(entry.justification.has_value());
    CHECK(*entry.justification == "customer request");
    CHECK(r.audit_seq == entry.seq);
    CHECK(fx.ledger->verify().ok);
}

TEST_CASE("Insufficient clearance is denied and audited", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);

    auto reversed = fx.reverser->descrub(fx.full_reversal(op, Tier::C2));
    REQUIRE(reversed.is_ok());
    const auto& r = reversed.value();
    CHECK(r.outcome == DeScrubOutcome::DENIED);
    CHECK_FALSE(r.content.has_value());
    CHECK(r.restored.empty());
    CHECK(r.required_tier == Tier::C4);
    CHECK_FALSE(r.reason.empty());

    REQUIRE(fx.ledger->size() == 2);
    CHECK(fx.ledger->entries().back().outcome == AuditOutcome::DENIED);
    for (const auto& line : fx.sink->lines()) {
        CHECK(line.find("BE71") == std::string::npos);
    }
}

TEST_CASE("Clearance comes from the role unless given explicitly", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);

    auto request = fx.full_reversal(op, std::nullopt);

    SECTION("Compliance officer holds C4") {
        request.role = "compliance_officer";
        CHECK(fx.reverser->descrub(request).value().outcome == DeScrubOutcome::GRANTED);
    }
    SECTION("Analyst holds C2") {
        request.role = "analyst";
        CHECK(fx.reverser->descrub(request).value().outcome == DeScrubOutcome::DENIED);
    }
    SECTION("Unknown role has no clearance") {
        request.role = "auditor";
        CHECK(fx.reverser->descrub(request).value().outcome == DeScrubOutcome::DENIED);
    }
    SECTION("Explicit clearance overrides the role") {
        request.role = "analyst";
        request.clearance = Tier::C4;
        CHECK(fx.reverser->descrub(request).value().outcome == DeScrubOutcome::GRANTED);
    }

    CHECK(fx.ledger->size() == 2);
}

// ============================================================================
// Selective and full reversal
// ============================================================================

TEST_CASE("Selective reversal restores only the chosen identifiers", "[descrub]") {
    PipelineFixture fx;
    auto scrubbed = fx.scrub(kMixedText, Tier::C3);
    REQUIRE(scrubbed.is_ok());

    std::string iban_id;
    std::string email_id;
    for (const auto& e : scrubbed.value().entities) {
        if (e.entity.label == "IBAN") iban_id = e.identifier;
        if (e.entity.label == "EMAIL") email_id = e.identifier;
    }
    REQUIRE_FALSE(iban_id.empty());
    REQUIRE_FALSE(email_id.empty());

    auto request = fx.full_reversal(scrubbed.value().operation_id, Tier::C3);
    request.identifiers = std::set<std::string>{email_id};

    auto reversed = fx.reverser->descrub(request);
    REQUIRE(reversed.is_ok());
    const auto& r = reversed.value();
    CHECK(r.outcome == DeScrubOutcome::GRANTED);
    CHECK(r.required_tier == Tier::C3);
    REQUIRE(r.content.has_value());
    CHECK(r.content->find("john.doe@example.com") != std::string::npos);
    CHECK(r.content->find(iban_id) != std::string::npos);
    CHECK(r.content->find("BE71") == std::string::npos);
    CHECK(r.restored == std::vector<std::string>{email_id});

    const auto entry = fx.ledger->entries().back();
    CHECK(entry.entities == std::vector<std::string>{email_id});
    CHECK(entry.tier == "C3");

    // The C4 value stays out of reach at C3
    request.identifiers = std::set<std::string>{iban_id};
    CHECK(fx.reverser->descrub(request).value().outcome == DeScrubOutcome::DENIED);
}

TEST_CASE("Full reversal of mixed actions reproduces the exact input", "[descrub]") {
    PipelineFixture fx;
    auto scrubbed = fx.scrub(kMixedText, Tier::C3);
    REQUIRE(scrubbed.is_ok());
    CHECK(scrubbed.value().content != kMixedText);
    CHECK(scrubbed.value().content.find("10.0.0.1") != std::string::npos);

    auto reversed = fx.reverser->descrub(fx.full_reversal(scrubbed.value().operation_id, Tier::C4));
    REQUIRE(reversed.is_ok());
    REQUIRE(reversed.value().outcome == DeScrubOutcome::GRANTED);
    CHECK(*reversed.value().content == kMixedText);
}

TEST_CASE("Cell-addressed operations reverse cell by cell", "[descrub][cells]") {
    PipelineFixture fx;
    CellScrubRequest request;
    request.actor = "alice";
    request.session_id = "sess-1";
    request.requested_tier = Tier::C3;
    request.cells = {{"Contacts", "B2", "jane@example.org"},
                     {"Accounts", "A1", "IBAN BE71 0961 2345 6769"}};

    auto scrubbed = fx.scrubber->scrub_cells(request);
    REQUIRE(scrubbed.is_ok());

    auto reversed = fx.reverser->descrub(fx.full_reversal(scrubbed.value().operation_id, Tier::C4));
    REQUIRE(reversed.is_ok());
    REQUIRE(reversed.value().outcome == DeScrubOutcome::GRANTED);
    CHECK_FALSE(reversed.value().content.has_value());
    REQUIRE(reversed.value().cells.has_value());
    const auto& cells = *reversed.value().cells;
    REQUIRE(cells.size() == 2);
    CHECK(cells[0].text == "jane@example.org");
    CHECK(cells[1].cell == "A1");
    CHECK(cells[1].text == "IBAN BE71 0961 2345 6769");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Malformed reversal requests are rejected without an audit entry", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);
    auto request = fx.full_reversal(op, Tier::C4);

    SECTION("Empty justification") {
        request.justification = " ";
        CHECK(fx.reverser->descrub(request).error_category() == ErrorCategory::VALIDATION_ERROR);
    }
    SECTION("Identifier from another operation") {
        request.identifiers = std::set<std::string>{"C4::IBAN::0123456789"};
        CHECK(fx.reverser->descrub(request).error_category() == ErrorCategory::VALIDATION_ERROR);
    }
    SECTION("Empty selection") {
        request.identifiers = std::set<std::string>{};
        CHECK(fx.reverser->descrub(request).error_category() == ErrorCategory::VALIDATION_ERROR);
    }
    SECTION("Unknown operation") {
        request.operation_id = "0f3c2a10-0000-4000-8000-00000000ffff";
        CHECK(fx.reverser->descrub(request).error_category() == ErrorCategory::NOT_FOUND);
    }

    CHECK(fx.ledger->size() == 1);
}

TEST_CASE("Key lost after scrubbing yields an audited error", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);
    fx.keys->set_available(false);

    auto reversed = fx.reverser->descrub(fx.full_reversal(op, Tier::C4));
    REQUIRE(reversed.is_ok());
    CHECK(reversed.value().outcome == DeScrubOutcome::ERROR);
    CHECK_FALSE(reversed.value().content.has_value());
    CHECK(fx.ledger->entries().back().outcome == AuditOutcome::ERROR);
}

TEST_CASE("Content is withheld when the grant cannot be audited", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);
    fx.sink->set_fail_writes(true);

    auto reversed = fx.reverser->descrub(fx.full_reversal(op, Tier::C4));
    REQUIRE(reversed.is_error());
    CHECK(reversed.error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(fx.ledger->size() == 1);
}

TEST_CASE("Invalidated receipt cannot be redeemed", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);
    REQUIRE(fx.receipts->invalidate(op, "withdrawn").is_ok());

    CHECK(fx.reverser->descrub(fx.full_reversal(op, Tier::C4)).error_category() ==
          ErrorCategory::NOT_FOUND);
}

TEST_CASE("Receipt without a committed scrub entry cannot be redeemed", "[descrub]") {
    PipelineFixture fx;
    const auto op = scrubbed_operation(fx, kIbanText, Tier::C3);

    auto stored = fx.receipts->get(op);
    REQUIRE(stored.is_ok());
    Receipt orphan = stored.value();
    orphan.operation_id = "0f3c2a10-0000-4000-8000-0000000000aa";
    REQUIRE(fx.receipts->put(orphan).is_ok());
    REQUIRE(fx.ledger->find_by_operation(orphan.operation_id).empty());

    auto reversed = fx.reverser->descrub(fx.full_reversal(orphan.operation_id, Tier::C4));
    REQUIRE(reversed.is_error());
    CHECK(reversed.error_category() == ErrorCategory::NOT_FOUND);
    CHECK(fx.ledger->size() == 1);

    // The committed original is still redeemable
    auto granted = fx.reverser->descrub(fx.full_reversal(op, Tier::C4));
    REQUIRE(granted.is_ok());
    CHECK(granted.value().outcome == DeScrubOutcome::GRANTED);
}
