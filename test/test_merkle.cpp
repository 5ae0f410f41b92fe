#include "sealchain/sealchain.hpp"
#include <doctest/doctest.h>
#include <string>
#include <vector>

namespace {

    std::string digest(const std::string &data) {
        auto result = chain::sha256Hex(data);
        REQUIRE(result.is_ok());
        return result.value();
    }

} // namespace

TEST_SUITE("Merkle Tree Tests") {
    TEST_CASE("SHA-256 primitive") {
        CHECK(digest("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_CASE("Empty input is rejected") {
        auto tree = chain::MerkleTree::build({});
        CHECK_FALSE(tree.is_ok());
        auto root = chain::merkleRoot({});
        CHECK_FALSE(root.is_ok());
    }

    TEST_CASE("Odd levels duplicate their last digest") {
        std::vector<chain::Value> entries = {chain::Value::object({{"slice_id", "a"}}),
                                             chain::Value::object({{"slice_id", "b"}}),
                                             chain::Value::object({{"slice_id", "c"}})};
        const std::string a = digest(R"({"slice_id": "a"})");
        const std::string b = digest(R"({"slice_id": "b"})");
        const std::string c = digest(R"({"slice_id": "c"})");
        const std::string expected = digest(digest(a + b) + digest(c + c));

        auto root = chain::merkleRoot(entries);
        REQUIRE(root.is_ok());
        CHECK(root.value() == expected);
        CHECK(root.value() == "443b15c7391a84d2101d606535eeba6f65dfd42f00b516a54a78ba445c1ac739");
    }

    TEST_CASE("Single entry is paired with itself") {
        auto root = chain::merkleRoot({chain::Value::object({{"slice_id", "a"}})});
        REQUIRE(root.is_ok());
        const std::string a = digest(R"({"slice_id": "a"})");
        CHECK(root.value() == digest(a + a));
    }

    TEST_CASE("Five entries pad two levels") {
        std::vector<std::string> leaves = {"l1", "l2", "l3", "l4", "l5"};
        auto tree = chain::MerkleTree::build(leaves);
        REQUIRE(tree.is_ok());

        const std::string l12 = digest(digest("l1") + digest("l2"));
        const std::string l34 = digest(digest("l3") + digest("l4"));
        const std::string l55 = digest(digest("l5") + digest("l5"));
        const std::string left = digest(l12 + l34);
        const std::string right = digest(l55 + l55);
        CHECK(tree.value().getRoot() == digest(left + right));
        CHECK(tree.value().getLeafCount() == 5);
        CHECK(tree.value().getDepth() == 4);
    }

    TEST_CASE("Inclusion proofs") {
        std::vector<std::string> leaves = {"tx_1", "tx_2", "tx_3"};
        auto tree_result = chain::MerkleTree::build(leaves);
        REQUIRE(tree_result.is_ok());
        const auto &tree = tree_result.value();

        for (size_t i = 0; i < leaves.size(); ++i) {
            auto proof = tree.getProof(i);
            REQUIRE(proof.is_ok());
            CHECK(proof.value().siblings.size() == 2);
            auto verified = chain::MerkleTree::verifyProof(leaves[i], proof.value(), tree.getRoot());
            REQUIRE(verified.is_ok());
            CHECK(verified.value());
        }

        auto proof = tree.getProof(0);
        REQUIRE(proof.is_ok());
        auto wrong_leaf = chain::MerkleTree::verifyProof("tx_forged", proof.value(), tree.getRoot());
        REQUIRE(wrong_leaf.is_ok());
        CHECK_FALSE(wrong_leaf.value());

        auto moved = proof.value();
        moved.leaf_index = 1;
        auto wrong_index = chain::MerkleTree::verifyProof("tx_1", moved, tree.getRoot());
        REQUIRE(wrong_index.is_ok());
        CHECK_FALSE(wrong_index.value());

        CHECK_FALSE(tree.getProof(3).is_ok());
    }

    TEST_CASE("Root depends on order and content") {
        auto ab = chain::MerkleTree::build({"a", "b"});
        auto ba = chain::MerkleTree::build({"b", "a"});
        auto ac = chain::MerkleTree::build({"a", "c"});
        REQUIRE(ab.is_ok());
        REQUIRE(ba.is_ok());
        REQUIRE(ac.is_ok());
        CHECK(ab.value().getRoot() != ba.value().getRoot());
        CHECK(ab.value().getRoot() != ac.value().getRoot());
    }
}
