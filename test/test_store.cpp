#include "sealchain/sealchain.hpp"
#include "support/tamper.hpp"
#include <doctest/doctest.h>
#include <string>

using sealchain::testing::Tamper;

namespace {

    chain::Ledger makeLedger() {
        auto config = chain::LedgerConfig::defaults();
        config.difficulty = 1;
        auto result = chain::Ledger::create(config);
        REQUIRE(result.is_ok());
        return std::move(result.value());
    }

    chain::Value sliceE1() { return chain::Value::object({{"slice_id", "e1"}, {"priority", 100}}); }

} // namespace

TEST_SUITE("Signed Store Tests") {
    TEST_CASE("Stored record verifies on retrieval") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);

        auto stored = store.store(sliceE1());
        REQUIRE(stored.is_ok());
        CHECK(ledger.size() == 2);
        CHECK(ledger.pendingCount() == 0);

        auto record = ledger.findEntry(stored.value());
        REQUIRE(record.has_value());
        CHECK(record->at(chain::RECORD_TYPE_FIELD).asString() == chain::DEFAULT_RECORD_TYPE);
        CHECK(record->at(chain::RECORD_METADATA_FIELD) == store.metadata());
        CHECK(record->at(chain::RECORD_CONTENT_FIELD).contains(chain::SIGNATURE_FIELD));
        CHECK_FALSE(record->at(chain::RECORD_CONTENT_FIELD).contains("data_id"));

        auto retrieved = store.retrieve(stored.value());
        REQUIRE(retrieved.is_ok());
        REQUIRE(retrieved.value().has_value());
        CHECK(retrieved.value()->at("slice_id").asString() == "e1");
        CHECK(retrieved.value()->at("priority").asInt() == 100);
    }

    TEST_CASE("Tampered content is not returned") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);
        auto stored = store.store(sliceE1());
        REQUIRE(stored.is_ok());

        Tamper::entryField(ledger, 1, 0, {chain::RECORD_CONTENT_FIELD, "priority"}, chain::Value(1));
        auto retrieved = store.retrieve(stored.value());
        REQUIRE(retrieved.is_ok());
        CHECK_FALSE(retrieved.value().has_value());

        auto by_slice = store.retrieveWhere(chain::DEFAULT_RECORD_TYPE, "slice_id", chain::Value("e1"));
        REQUIRE(by_slice.is_ok());
        CHECK_FALSE(by_slice.value().has_value());
    }

    TEST_CASE("Bookkeeping fields outside the envelope do not affect verification") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);
        auto stored = store.store(sliceE1());
        REQUIRE(stored.is_ok());

        Tamper::entryField(ledger, 1, 0, {"metadata", "version"}, chain::Value("2.0"));
        auto retrieved = store.retrieve(stored.value());
        REQUIRE(retrieved.is_ok());
        CHECK(retrieved.value().has_value());
    }

    TEST_CASE("Missing and unsigned entries") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);

        auto missing = store.retrieve("no-such-entry");
        REQUIRE(missing.is_ok());
        CHECK_FALSE(missing.value().has_value());

        std::string plain = ledger.enqueue(chain::Value::object({{"slice_id", "raw"}}));
        REQUIRE(ledger.sealPending().is_ok());
        auto unsigned_entry = store.retrieve(plain);
        REQUIRE(unsigned_entry.is_ok());
        CHECK_FALSE(unsigned_entry.value().has_value());

        auto scalar = store.store(chain::Value(5));
        REQUIRE_FALSE(scalar.is_ok());
        CHECK(scalar.error().code == sealchain::ERR_SIGNING_FAILED);
        CHECK(ledger.pendingCount() == 0);
    }

    TEST_CASE("Lookup by content field") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);
        REQUIRE(store.store(sliceE1()).is_ok());
        REQUIRE(store.store(chain::Value::object({{"slice_id", "c1"}, {"priority", 50}})).is_ok());
        REQUIRE(store.store(chain::Value::object({{"sensor", "s1"}}), "telemetry").is_ok());

        auto c1 = store.retrieveWhere(chain::DEFAULT_RECORD_TYPE, "slice_id", chain::Value("c1"));
        REQUIRE(c1.is_ok());
        REQUIRE(c1.value().has_value());
        CHECK(c1.value()->at("priority").asInt() == 50);

        auto telemetry = store.retrieveWhere("telemetry", "sensor", chain::Value("s1"));
        REQUIRE(telemetry.is_ok());
        CHECK(telemetry.value().has_value());

        auto wrong_type = store.retrieveWhere("telemetry", "slice_id", chain::Value("c1"));
        REQUIRE(wrong_type.is_ok());
        CHECK_FALSE(wrong_type.value().has_value());
    }

    TEST_CASE("Retrieval follows the current verification key") {
        auto ledger = makeLedger();
        chain::SignedStore store(ledger);
        auto stored = store.store(sliceE1());
        REQUIRE(stored.is_ok());

        Tamper::sharedKey(ledger, "verification", "NB_KEY_5G_VERIFICATION_OTHER");
        auto rejected = store.retrieve(stored.value());
        REQUIRE(rejected.is_ok());
        CHECK_FALSE(rejected.value().has_value());

        chain::RepairEngine engine(ledger);
        Tamper::sharedKey(ledger, "verification", "BROKEN");
        auto report = engine.repair();
        REQUIRE(report.is_ok());
        CHECK(report.value().keys_reset);

        auto accepted = store.retrieve(stored.value());
        REQUIRE(accepted.is_ok());
        CHECK(accepted.value().has_value());
    }
}
