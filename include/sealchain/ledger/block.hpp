#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include "clock.hpp"
#include "digest.hpp"
#include "value.hpp"

namespace sealchain::ledger {

    /// Sentinel link of the genesis block
    inline constexpr const char *GENESIS_PREVIOUS_HASH = "0";

    class Block {
      public:
        dp::i64 index_{0};
        Timestamp timestamp_{};
        Value data_{};
        std::string previous_hash_{};
        dp::i64 nonce_{0};
        std::string hash_{};

        Block() = default;

        inline Block(dp::i64 index, Timestamp timestamp, Value data, std::string previous_hash)
            : index_(index), timestamp_(timestamp), data_(std::move(data)), previous_hash_(std::move(previous_hash)) {}

        /// Builds a block and stores its initial (unsealed) digest
        inline static dp::Result<Block, dp::Error> create(dp::i64 index, Timestamp timestamp, Value data,
                                                          std::string previous_hash) {
            Block block(index, timestamp, std::move(data), std::move(previous_hash));
            auto hash_result = block.calculateHash();
            if (!hash_result.is_ok())
                return dp::Result<Block, dp::Error>::err(hash_result.error());
            block.hash_ = hash_result.value();
            return dp::Result<Block, dp::Error>::ok(std::move(block));
        }

        /// Canonical form of every hashed field, keys sorted
        inline std::string canonicalContents() const {
            Value contents = Value::object({{"index", index_},
                                            {"timestamp", timestamp_.iso8601()},
                                            {"data", data_},
                                            {"previous_hash", previous_hash_},
                                            {"nonce", nonce_}});
            return contents.canonical();
        }

        inline dp::Result<std::string, dp::Error> calculateHash() const { return sha256Hex(canonicalContents()); }

        /// Proof-of-work: bumps the nonce until the digest has `difficulty` leading zeros.
        /// Returns the number of digests computed. Expected cost is 16^difficulty.
        /// Difficulties outside 0..MAX_DIFFICULTY are rejected.
        inline dp::Result<dp::i64, dp::Error> mine(int difficulty) {
            if (difficulty < 0 || difficulty > MAX_DIFFICULTY) {
                return dp::Result<dp::i64, dp::Error>::err(invalid_block(
                    dp::String(("Difficulty must be within 0.." + std::to_string(MAX_DIFFICULTY)).c_str())));
            }
            auto hash_result = calculateHash();
            if (!hash_result.is_ok())
                return dp::Result<dp::i64, dp::Error>::err(hash_result.error());
            hash_ = hash_result.value();
            dp::i64 attempts = 1;
            while (!meetsDifficulty(hash_, difficulty)) {
                ++nonce_;
                hash_result = calculateHash();
                if (!hash_result.is_ok())
                    return dp::Result<dp::i64, dp::Error>::err(hash_result.error());
                hash_ = hash_result.value();
                ++attempts;
            }
            return dp::Result<dp::i64, dp::Error>::ok(attempts);
        }

        /// Stored digest still matches the block contents
        inline dp::Result<bool, dp::Error> hashMatches() const {
            auto calc_hash = calculateHash();
            if (!calc_hash.is_ok())
                return dp::Result<bool, dp::Error>::err(calc_hash.error());
            return dp::Result<bool, dp::Error>::ok(hash_ == calc_hash.value());
        }

        inline bool isGenesis() const { return index_ == 0; }

        /// Merkle root of an aggregated block, empty for blocks without entries
        inline std::string merkleRoot() const {
            const Value *root = data_.find("merkle_root");
            return (root && root->isString()) ? root->asString() : std::string{};
        }

        inline size_t entryCount() const {
            const Value *entries = data_.find("entries");
            return (entries && entries->isArray()) ? entries->size() : 0;
        }

        inline Value toValue() const {
            return Value::object({{"index", index_},
                                  {"timestamp", timestamp_.iso8601()},
                                  {"data", data_},
                                  {"previous_hash", previous_hash_},
                                  {"nonce", nonce_},
                                  {"hash", hash_}});
        }
    };

} // namespace sealchain::ledger
