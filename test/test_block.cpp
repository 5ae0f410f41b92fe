#include "sealchain/sealchain.hpp"
#include <doctest/doctest.h>
#include <string>

namespace {

    chain::Block makeBlock() {
        auto result = chain::Block::create(1, chain::Timestamp(0, 0),
                                           chain::Value::object({{"message", "hello"}, {"count", 3}}), "0");
        REQUIRE(result.is_ok());
        return result.value();
    }

} // namespace

TEST_SUITE("Block Tests") {
    TEST_CASE("Block creation computes its digest") {
        auto block = makeBlock();

        CHECK(block.index_ == 1);
        CHECK(block.previous_hash_ == "0");
        CHECK(block.nonce_ == 0);
        CHECK(block.hash_.size() == 64);

        auto matches = block.hashMatches();
        REQUIRE(matches.is_ok());
        CHECK(matches.value());
    }

    TEST_CASE("Canonical contents and digest are reproducible") {
        auto block = makeBlock();
        CHECK(block.canonicalContents() ==
              R"({"data": {"count": 3, "message": "hello"}, "index": 1, "nonce": 0, "previous_hash": "0", )"
              R"("timestamp": "1970-01-01T00:00:00.000000"})");
        CHECK(block.hash_ == "379f7ab1a195af95462eb6a90fd11b0211bae5fb4047d7af428d9357a9d987af");

        auto again = makeBlock();
        CHECK(again.hash_ == block.hash_);
    }

    TEST_CASE("Digest covers every field") {
        auto base = makeBlock();
        auto differs = [&base](const chain::Block &changed) {
            auto hash = changed.calculateHash();
            REQUIRE(hash.is_ok());
            return hash.value() != base.hash_;
        };

        auto other = base;
        other.data_["count"] = 4;
        CHECK(differs(other));

        other = base;
        other.previous_hash_ = "1";
        CHECK(differs(other));

        other = base;
        other.nonce_ = 7;
        CHECK(differs(other));

        other = base;
        other.timestamp_ = chain::Timestamp(1, 0);
        CHECK(differs(other));
    }

    TEST_CASE("Out-of-band payload change breaks the stored digest") {
        auto block = makeBlock();
        block.data_["message"] = "tampered";
        auto matches = block.hashMatches();
        REQUIRE(matches.is_ok());
        CHECK_FALSE(matches.value());
    }

    TEST_CASE("Aggregated block accessors") {
        auto result = chain::Block::create(
            2, chain::Timestamp::now(),
            chain::Value::object({{"entries", chain::Value::array({chain::Value::object({{"k", 1}})})},
                                  {"merkle_root", "abc"}}),
            "prev");
        REQUIRE(result.is_ok());
        CHECK(result.value().entryCount() == 1);
        CHECK(result.value().merkleRoot() == "abc");

        auto plain = makeBlock();
        CHECK(plain.entryCount() == 0);
        CHECK(plain.merkleRoot().empty());
    }

    TEST_CASE("Block rendering") {
        auto block = makeBlock();
        auto rendered = block.toValue();
        CHECK(rendered.at("index").asInt() == 1);
        CHECK(rendered.at("hash").asString() == block.hash_);
        CHECK(rendered.at("timestamp").asString() == "1970-01-01T00:00:00.000000");
    }
}
