#include "sealchain/sealchain.hpp"
#include <doctest/doctest.h>
#include <string>

TEST_SUITE("Shared Keys and Configuration") {
    TEST_CASE("Default ring is well formed") {
        chain::SharedKeys keys(chain::defaultSharedKeys());
        CHECK(keys.isValid());
        CHECK(keys.corruptedKeys().empty());
        CHECK(keys.expectedPrefix("verification") == "NB_KEY_5G_VERIFICATION_");
        CHECK(keys.get("primary").value() == "NB_KEY_5G_PRIMARY_12345");
        CHECK_FALSE(keys.get("unknown").has_value());
    }

    TEST_CASE("Malformed and missing keys are reported in name order") {
        chain::SharedKeys keys(chain::defaultSharedKeys());
        keys.set("secondary", "TAMPERED_KEY");
        keys.set("primary", "NB_KEY_5G_SECONDARY_12345");
        auto corrupted = keys.corruptedKeys();
        REQUIRE(corrupted.size() == 2);
        CHECK(corrupted[0] == "primary");
        CHECK(corrupted[1] == "secondary");

        CHECK(keys.entries().at("secondary") == "TAMPERED_KEY");
        CHECK(keys.canonicalEntries() == chain::defaultSharedKeys());

        keys.resetToCanonical();
        CHECK(keys.isValid());
        CHECK(keys.get("secondary").value() == "NB_KEY_5G_SECONDARY_67890");
        CHECK(keys.entries() == keys.canonicalEntries());
    }

    TEST_CASE("Custom prefix") {
        chain::SharedKeys keys({{"verification", "LAB_VERIFICATION_1"}}, "LAB_");
        CHECK(keys.isValid());
        keys.set("verification", "NB_KEY_5G_VERIFICATION_ABCDE");
        CHECK_FALSE(keys.isValid());
    }

    TEST_CASE("Configuration validation") {
        CHECK(chain::LedgerConfig::defaults().validate().is_ok());

        auto config = chain::LedgerConfig::defaults();
        config.difficulty = -1;
        CHECK_FALSE(config.validate().is_ok());

        config = chain::LedgerConfig::defaults();
        config.difficulty = chain::MAX_DIFFICULTY + 1;
        CHECK_FALSE(config.validate().is_ok());

        config = chain::LedgerConfig::defaults();
        config.key_prefix = "";
        CHECK_FALSE(config.validate().is_ok());

        config = chain::LedgerConfig::defaults();
        config.shared_keys["verification"] = "NB_KEY_5G_VERIFY_ABCDE";
        auto result = config.validate();
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.error().code == sealchain::ERR_INVALID_CONFIG);

        config = chain::LedgerConfig::defaults();
        config.shared_keys.erase("verification");
        auto missing = config.validate();
        REQUIRE_FALSE(missing.is_ok());
        CHECK(missing.error().code == sealchain::ERR_KEY_MISSING);
    }

    TEST_CASE("Ledger refuses an invalid configuration") {
        auto config = chain::LedgerConfig::defaults();
        config.difficulty = -3;
        CHECK_FALSE(chain::Ledger::create(config).is_ok());
    }
}
