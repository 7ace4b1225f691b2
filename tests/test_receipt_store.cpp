#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "receipt/receipt_metrics.hpp"
#include "receipt/receipt_store.hpp"
#include "mocks/tmp_dir.hpp"

#include <filesystem>
#include <format>
#include <sys/stat.h>

using namespace redactguard;
using namespace redactguard::testing;

namespace {

Receipt sample_receipt(const std::string& operation_id) {
    Receipt r;
    r.operation_id = operation_id;
    r.created_at = "2025-03-01T10:00:00.000Z";
    r.requested_tier = Tier::C3;
    r.manifest_version = "C1:t1,C2:t1,C3:t1,C4:t1";
    r.original_hash = std::string(64, 'a');
    r.scrubbed_hash = std::string(64, 'b');
    r.latency_ms = 12;
    r.units.push_back(ReceiptUnit{std::nullopt, "IBAN C4::IBAN::0123456789 \"quoted\""});

    ReceiptEntity e;
    e.identifier = "C4::IBAN::0123456789";
    e.label = "IBAN";
    e.tier = Tier::C4;
    e.rule_id = "IBAN_basic";
    e.confidence = 0.95;
    e.action = Action::REDACT;
    e.unit = 0;
    e.span = Span{5, 24, std::nullopt};
    e.output_span = Span{5, 25, std::nullopt};
    r.entities.push_back(e);

    r.encrypted_values[e.identifier] = "ENC:v1:test-key-001:AAAA";
    r.placeholder_map[e.identifier] = e.identifier;
    return r;
}

} // anonymous namespace

// ============================================================================
// Codec
// ============================================================================

TEST_CASE("Receipt codec preserves every field", "[receipt]") {
    const auto original = sample_receipt("0f3c2a10-0000-4000-8000-000000000001");
    auto parsed = receipt_codec::parse(receipt_codec::serialize(original));
    REQUIRE(parsed.is_ok());

    const auto& r = parsed.value();
    CHECK(r.operation_id == original.operation_id);
    CHECK(r.requested_tier == Tier::C3);
    CHECK(r.manifest_version == original.manifest_version);
    CHECK(r.original_hash == original.original_hash);
    CHECK(r.latency_ms == 12);
    REQUIRE(r.units.size() == 1);
    CHECK(r.units[0].scrubbed == original.units[0].scrubbed);
    CHECK_FALSE(r.structured());

    REQUIRE(r.entities.size() == 1);
    CHECK(r.entities[0].tier == Tier::C4);
    CHECK(r.entities[0].confidence == Catch::Approx(0.95));
    CHECK(r.entities[0].span.end == 24);
    CHECK(r.entities[0].output_span.end == 25);
    CHECK(r.encrypted_values == original.encrypted_values);
    CHECK(r.placeholder_map == original.placeholder_map);
}

TEST_CASE("Receipt codec keeps cell coordinates", "[receipt]") {
    auto original = sample_receipt("0f3c2a10-0000-4000-8000-000000000002");
    original.units[0].cell = CellCoordinate{"Accounts", "C7"};
    original.entities[0].span.cell = CellCoordinate{"Accounts", "C7"};

    auto parsed = receipt_codec::parse(receipt_codec::serialize(original));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().structured());
    CHECK(parsed.value().units[0].cell->sheet == "Accounts");
    CHECK(parsed.value().units[0].cell->cell == "C7");
}

TEST_CASE("Receipt codec rejects damaged documents", "[receipt]") {
    CHECK(receipt_codec::parse("").error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(receipt_codec::parse("[1,2,3]").error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(receipt_codec::parse("{\"operation_id\":").is_error());
}

TEST_CASE("Operation id shape", "[receipt]") {
    CHECK(is_valid_operation_id("0f3c2a10-0000-4000-8000-000000000001"));
    CHECK_FALSE(is_valid_operation_id(""));
    CHECK_FALSE(is_valid_operation_id("../etc/passwd"));
    CHECK_FALSE(is_valid_operation_id(std::string(65, 'a')));
}

// ============================================================================
// Stores
// ============================================================================

TEST_CASE("Memory store is write-once and honours invalidation", "[receipt]") {
    MemoryReceiptStore store;
    const auto receipt = sample_receipt("0f3c2a10-0000-4000-8000-000000000003");

    REQUIRE(store.put(receipt).is_ok());
    CHECK(store.size() == 1);

    auto again = store.put(receipt);
    REQUIRE(again.is_error());
    CHECK(again.error_category() == ErrorCategory::CONFLICT);

    auto loaded = store.get(receipt.operation_id);
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().entities.size() == 1);

    REQUIRE(store.invalidate(receipt.operation_id, "audit append failed").is_ok());
    CHECK(store.is_invalidated(receipt.operation_id));
    CHECK(store.get(receipt.operation_id).error_category() == ErrorCategory::NOT_FOUND);

    CHECK(store.get("0f3c2a10-0000-4000-8000-00000000ffff").error_category() == ErrorCategory::NOT_FOUND);
    CHECK(store.put(sample_receipt("not/an/id")).error_category() == ErrorCategory::VALIDATION_ERROR);
}

TEST_CASE("File store writes one private file per operation", "[receipt]") {
    TmpDir tmp("redactguard_receipts");
    FileReceiptStore store(tmp.sub("receipts"));
    const auto receipt = sample_receipt("0f3c2a10-0000-4000-8000-000000000004");

    REQUIRE(store.put(receipt).is_ok());

    const auto path = std::filesystem::path(tmp.sub("receipts")) / (receipt.operation_id + ".json");
    REQUIRE(std::filesystem::exists(path));

    struct stat st{};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    auto loaded = store.get(receipt.operation_id);
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().original_hash == receipt.original_hash);

    SECTION("Second put is a conflict and leaves the first intact") {
        auto modified = receipt;
        modified.original_hash = std::string(64, 'c');
        CHECK(store.put(modified).error_category() == ErrorCategory::CONFLICT);
        CHECK(store.get(receipt.operation_id).value().original_hash == receipt.original_hash);
    }

    SECTION("Invalidated receipt stays on disk but cannot be redeemed") {
        REQUIRE(store.invalidate(receipt.operation_id, "cancelled").is_ok());
        REQUIRE(store.invalidate(receipt.operation_id, "cancelled twice").is_ok());
        CHECK(std::filesystem::exists(path));
        CHECK(store.get(receipt.operation_id).error_category() == ErrorCategory::NOT_FOUND);

        // A fresh store over the same directory still refuses it
        FileReceiptStore reopened(tmp.sub("receipts"));
        CHECK(reopened.get(receipt.operation_id).error_category() == ErrorCategory::NOT_FOUND);
    }
}

TEST_CASE("File store lists stored operations in order", "[receipt]") {
    TmpDir tmp("redactguard_receipts_list");
    FileReceiptStore store(tmp.sub("receipts"));
    REQUIRE(store.put(sample_receipt("0f3c2a10-0000-4000-8000-000000000012")).is_ok());
    REQUIRE(store.put(sample_receipt("0f3c2a10-0000-4000-8000-000000000011")).is_ok());
    REQUIRE(store.invalidate("0f3c2a10-0000-4000-8000-000000000012", "cancelled").is_ok());

    const auto ids = store.operation_ids();
    REQUIRE(ids.size() == 2);
    CHECK(ids[0] == "0f3c2a10-0000-4000-8000-000000000011");
    CHECK(ids[1] == "0f3c2a10-0000-4000-8000-000000000012");
}

// ============================================================================
// Metrics
// ============================================================================

TEST_CASE("Metrics count labels and actions and skip invalidated receipts", "[receipt][metrics]") {
    MemoryReceiptStore store;
    const uint64_t latencies[] = {10, 30, 20, 40, 100};
    for (size_t i = 0; i < 5; ++i) {
        auto r = sample_receipt(std::format("0f3c2a10-0000-4000-8000-00000000002{}", i));
        r.latency_ms = latencies[i];
        if (i % 2 == 0) {
            ReceiptEntity email;
            email.identifier = "C3::EMAIL::abcdef0123";
            email.label = "EMAIL";
            email.tier = Tier::C3;
            email.action = Action::MASK;
            email.span = Span{30, 40, std::nullopt};
            email.output_span = Span{31, 41, std::nullopt};
            r.entities.push_back(email);
        }
        REQUIRE(store.put(r).is_ok());
    }
    REQUIRE(store.put(sample_receipt("0f3c2a10-0000-4000-8000-000000000029")).is_ok());
    REQUIRE(store.invalidate("0f3c2a10-0000-4000-8000-000000000029", "orphaned").is_ok());

    const auto m = summarize_receipts(store);
    CHECK(m.receipts == 5);
    CHECK(m.entities == 8);
    CHECK(m.by_label.at("IBAN") == 5);
    CHECK(m.by_label.at("EMAIL") == 3);
    CHECK(m.by_action.at("redact") == 5);
    CHECK(m.by_action.at("mask") == 3);
    CHECK(m.latency_p50_ms == 30);
    CHECK(m.latency_p90_ms == 40);

    CHECK(m.to_json() ==
          R"({"receipts":5,"entities":8,"by_label":{"EMAIL":3,"IBAN":5},)"
          R"("by_action":{"mask":3,"redact":5},"latency_ms":{"p50":30,"p90":40}})");

    SECTION("Limit keeps the most recent ids") {
        const auto last_two = summarize_receipts(store, 2);
        CHECK(last_two.receipts == 1);      // ...24 plus the invalidated ...29
        CHECK(last_two.latency_p50_ms == 100);
    }
}

TEST_CASE("Metrics over an empty store are zero", "[receipt][metrics]") {
    MemoryReceiptStore store;
    const auto m = summarize_receipts(store);
    CHECK(m.receipts == 0);
    CHECK(m.latency_p50_ms == 0);
    CHECK(m.latency_p90_ms == 0);
    CHECK(m.to_json() == R"({"receipts":0,"entities":0,"by_label":{},"by_action":{},"latency_ms":{"p50":0,"p90":0}})");
}

TEST_CASE("File store reports missing and malformed ids", "[receipt]") {
    TmpDir tmp("redactguard_receipts_missing");
    FileReceiptStore store(tmp.path.string());

    CHECK(store.get("0f3c2a10-0000-4000-8000-000000000005").error_category() == ErrorCategory::NOT_FOUND);
    CHECK(store.get("../../etc/passwd").error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(store.name() == "file:" + tmp.path.string());
}
