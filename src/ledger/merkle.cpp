#include <sealchain/common/error.hpp>
#include <sealchain/ledger/digest.hpp>
#include <sealchain/ledger/merkle.hpp>

namespace sealchain::ledger {

    namespace {

        dp::Result<std::string, dp::Error> combineHashes(const std::string &left, const std::string &right) {
            return sha256Hex(left + right);
        }

        void padOdd(std::vector<std::string> &level) {
            if (level.size() % 2 == 1 && !level.empty())
                level.push_back(level.back());
        }

    } // namespace

    dp::Result<MerkleTree, dp::Error> MerkleTree::build(const std::vector<std::string> &leaves) {
        if (leaves.empty())
            return dp::Result<MerkleTree, dp::Error>::err(merkle_empty("Cannot build a merkle tree without entries"));
        MerkleTree tree;
        tree.leaves_ = leaves;
        auto built = tree.buildTree();
        if (!built.is_ok())
            return dp::Result<MerkleTree, dp::Error>::err(built.error());
        return dp::Result<MerkleTree, dp::Error>::ok(std::move(tree));
    }

    dp::Result<MerkleTree, dp::Error> MerkleTree::fromEntries(const std::vector<Value> &entries) {
        std::vector<std::string> leaves;
        leaves.reserve(entries.size());
        for (const auto &entry : entries)
            leaves.push_back(entry.canonical());
        return build(leaves);
    }

    dp::Result<void, dp::Error> MerkleTree::buildTree() {
        tree_levels_.clear();
        std::vector<std::string> current_level;
        current_level.reserve(leaves_.size() + 1);
        for (const auto &leaf : leaves_) {
            auto leaf_hash = sha256Hex(leaf);
            if (!leaf_hash.is_ok())
                return dp::Result<void, dp::Error>::err(leaf_hash.error());
            current_level.push_back(leaf_hash.value());
        }
        padOdd(current_level);
        tree_levels_.push_back(current_level);

        while (current_level.size() > 1) {
            std::vector<std::string> next_level;
            next_level.reserve(current_level.size() / 2 + 1);
            for (size_t i = 0; i < current_level.size(); i += 2) {
                auto combined = combineHashes(current_level[i], current_level[i + 1]);
                if (!combined.is_ok())
                    return dp::Result<void, dp::Error>::err(combined.error());
                next_level.push_back(combined.value());
            }
            if (next_level.size() > 1)
                padOdd(next_level);
            tree_levels_.push_back(next_level);
            current_level = std::move(next_level);
        }
        root_hash_ = current_level.front();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<MerkleProof, dp::Error> MerkleTree::getProof(size_t leaf_index) const {
        if (leaf_index >= leaves_.size())
            return dp::Result<MerkleProof, dp::Error>::err(dp::Error::out_of_range("Leaf index out of range"));
        MerkleProof proof;
        proof.leaf_index = leaf_index;
        size_t current_index = leaf_index;
        for (size_t level = 0; level + 1 < tree_levels_.size(); level++) {
            const auto &nodes = tree_levels_[level];
            size_t sibling_index = (current_index % 2 == 0) ? current_index + 1 : current_index - 1;
            proof.siblings.push_back(nodes[sibling_index]);
            current_index /= 2;
        }
        return dp::Result<MerkleProof, dp::Error>::ok(std::move(proof));
    }

    dp::Result<bool, dp::Error> MerkleTree::verifyProof(const std::string &leaf_data, const MerkleProof &proof,
                                                        const std::string &expected_root) {
        auto current = sha256Hex(leaf_data);
        if (!current.is_ok())
            return dp::Result<bool, dp::Error>::err(current.error());
        std::string current_hash = current.value();
        size_t current_index = proof.leaf_index;
        for (const auto &sibling : proof.siblings) {
            auto combined = (current_index % 2 == 0) ? combineHashes(current_hash, sibling)
                                                     : combineHashes(sibling, current_hash);
            if (!combined.is_ok())
                return dp::Result<bool, dp::Error>::err(combined.error());
            current_hash = combined.value();
            current_index /= 2;
        }
        return dp::Result<bool, dp::Error>::ok(current_hash == expected_root);
    }

    dp::Result<std::string, dp::Error> merkleRoot(const std::vector<Value> &entries) {
        auto tree = MerkleTree::fromEntries(entries);
        if (!tree.is_ok())
            return dp::Result<std::string, dp::Error>::err(tree.error());
        return dp::Result<std::string, dp::Error>::ok(tree.value().getRoot());
    }

} // namespace sealchain::ledger
