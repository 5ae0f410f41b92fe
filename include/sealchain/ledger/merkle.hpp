#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "value.hpp"

namespace sealchain::ledger {

    /// Sibling digests from a leaf up to (excluding) the root
    struct MerkleProof {
        size_t leaf_index{0};
        std::vector<std::string> siblings{};
    };

    /// Binary hash tree over a batch of entries.
    ///
    /// Every level with an odd number of nodes is padded by repeating its last
    /// digest, including the leaf level, so a single entry `a` has root
    /// H(H(a) + H(a)).
    class MerkleTree {
      private:
        std::vector<std::string> leaves_;
        std::vector<std::vector<std::string>> tree_levels_;
        std::string root_hash_;

      public:
        MerkleTree() = default;

        /// Builds over raw leaf strings. Fails on empty input.
        static dp::Result<MerkleTree, dp::Error> build(const std::vector<std::string> &leaves);

        /// Builds over the canonical form of each entry
        static dp::Result<MerkleTree, dp::Error> fromEntries(const std::vector<Value> &entries);

        const std::string &getRoot() const { return root_hash_; }
        size_t getLeafCount() const { return leaves_.size(); }
        size_t getDepth() const { return tree_levels_.size(); }

        dp::Result<MerkleProof, dp::Error> getProof(size_t leaf_index) const;

        /// Recomputes the root from `leaf_data` and `proof` and compares it to `expected_root`
        static dp::Result<bool, dp::Error> verifyProof(const std::string &leaf_data, const MerkleProof &proof,
                                                       const std::string &expected_root);

      private:
        dp::Result<void, dp::Error> buildTree();
    };

    /// Root digest over `entries`; `entries` must not be empty
    dp::Result<std::string, dp::Error> merkleRoot(const std::vector<Value> &entries);

} // namespace sealchain::ledger
