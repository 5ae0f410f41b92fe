#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "auditor.hpp"
#include "chain.hpp"

namespace sealchain::ledger {

    inline constexpr const char *REPAIR_REASON = "auto-repair";

    /// Structural state of one block, enough to show what a repair rewrote
    struct BlockState {
        dp::i64 index{0};
        std::string hash{};
        std::string previous_hash{};
        dp::i64 nonce{0};

        bool operator==(const BlockState &other) const {
            return index == other.index && hash == other.hash && previous_hash == other.previous_hash &&
                   nonce == other.nonce;
        }
        bool operator!=(const BlockState &other) const { return !(*this == other); }
    };

    using ChainSnapshot = std::vector<BlockState>;

    ChainSnapshot snapshot(const Ledger &ledger);

    struct RepairReport {
        bool success{false};
        std::string message{};
        std::vector<dp::i64> repaired_indices{};
        std::vector<dp::i64> affected_indices{};
        bool keys_reset{false};
        ChainSnapshot before{};
        ChainSnapshot after{};
    };

    /// Restores internal consistency of a tampered ledger.
    ///
    /// Tampered -> Clean is the only transition. Blocks are re-linked and
    /// re-sealed left to right from the earliest inconsistent index to the tip,
    /// with the merkle root of each aggregated block recomputed over its current
    /// entries; a malformed key ring is reset to its configured values. The result is a
    /// self-consistent chain: it proves nothing about whether the repaired
    /// content equals what was originally sealed.
    class RepairEngine {
      public:
        explicit RepairEngine(Ledger &ledger) : ledger_(ledger) {}

        dp::Result<RepairReport, dp::Error> repair();

        /// verify(), then repair() and verify() again when the ledger is not valid.
        /// Reports failure when issues remain after the repair pass.
        dp::Result<RepairReport, dp::Error> autoRepairIfNeeded();

        dp::Result<ChainState, dp::Error> state() const { return IntegrityAuditor(ledger_).state(); }

        const std::vector<RepairRecord> &history() const { return ledger_.repair_history_; }

      private:
        Ledger &ledger_;
    };

} // namespace sealchain::ledger
