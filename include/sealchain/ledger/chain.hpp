#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include "block.hpp"
#include "config.hpp"
#include "keys.hpp"
#include "merkle.hpp"
#include "value.hpp"

namespace sealchain::testing {
    struct Tamper;
}

namespace sealchain::ledger {

    class RepairEngine;

    /// Outcome of a whole-ledger verification. A failed check is data, not an error.
    struct Verification {
        bool valid{false};
        std::string message{};
    };

    /// Why a single block fails its integrity checks
    enum class BlockFault { None, HashMismatch, BrokenLink };

    /// Audit trail entry appended by every repair that changed the ledger
    struct RepairRecord {
        std::string timestamp{};
        std::string reason{};
        std::vector<dp::i64> affected_indices{};
        bool keys_reset{false};
    };

    /// Append-only hash-chained ledger.
    ///
    /// Block 0 is sealed at construction. Producers enqueue payloads, which are
    /// aggregated under a merkle root and sealed into the next block by
    /// sealPending(). Blocks are never removed; only RepairEngine rewrites them
    /// in place.
    ///
    /// Not thread-safe: callers sharing a ledger across threads must hold one
    /// writer lock around every call, since sealing, verification and repair all
    /// read and then write the chain and the pending buffer.
    class Ledger {
      public:
        static dp::Result<Ledger, dp::Error> create(LedgerConfig config = LedgerConfig::defaults());

        /// Queues `payload` for the next block, stamping it with `data_id` and `timestamp`.
        /// Non-object payloads are wrapped as `{"value": payload}`. Returns the entry id.
        /// The stamped fields land at the top level, so signed envelopes go through SignedStore.
        std::string enqueue(Value payload);

        /// Seals every pending entry into a new block. An empty buffer yields no block.
        dp::Result<std::optional<Block>, dp::Error> sealPending();

        /// Fail-fast check of blocks 1..N-1 (digest, then link) followed by the shared keys
        dp::Result<Verification, dp::Error> verify() const;

        /// Checks one block against its stored digest and its predecessor. Genesis is never flagged.
        dp::Result<BlockFault, dp::Error> inspectBlock(size_t index) const;

        std::optional<Value> findEntry(const std::string &entry_id) const;

        dp::Result<MerkleProof, dp::Error> proveEntry(size_t block_index, size_t entry_position) const;
        dp::Result<bool, dp::Error> verifyEntryInclusion(size_t block_index, size_t entry_position) const;

        const std::vector<Block> &blocks() const { return blocks_; }
        const Block &latestBlock() const { return blocks_.back(); }
        dp::Result<Block, dp::Error> blockAt(size_t index) const;
        size_t size() const { return blocks_.size(); }

        const std::vector<Value> &pending() const { return pending_; }
        size_t pendingCount() const { return pending_.size(); }

        const SharedKeys &keys() const { return keys_; }
        const LedgerConfig &config() const { return config_; }
        int difficulty() const { return config_.difficulty; }

        const std::vector<RepairRecord> &repairHistory() const { return repair_history_; }

        /// Whole chain as an array of {index, timestamp, data, previous_hash, nonce, hash}
        Value chainData() const;

      private:
        explicit Ledger(LedgerConfig config);

        dp::Result<void, dp::Error> createGenesis();

        friend class RepairEngine;
        friend struct sealchain::testing::Tamper;

        LedgerConfig config_;
        SharedKeys keys_;
        std::vector<Block> blocks_;
        std::vector<Value> pending_;
        std::vector<RepairRecord> repair_history_;
    };

} // namespace sealchain::ledger
