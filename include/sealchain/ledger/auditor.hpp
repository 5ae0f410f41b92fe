#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "chain.hpp"

namespace sealchain::ledger {

    enum class ChainState { Clean, Tampered };

    struct BlockFinding {
        dp::i64 index{0};
        BlockFault fault{BlockFault::None};
    };

    /// Read-only scanner over a ledger.
    ///
    /// Block consistency and key-ring format are independent axes; the chain is
    /// Clean only when both pass.
    class IntegrityAuditor {
      public:
        explicit IntegrityAuditor(const Ledger &ledger) : ledger_(ledger) {}

        /// Every inconsistent block after genesis, in index order, each reported once
        dp::Result<std::vector<BlockFinding>, dp::Error> findings() const;

        /// Indices of findings()
        dp::Result<std::vector<dp::i64>, dp::Error> detect() const;

        bool keysCorrupted() const { return !ledger_.keys().isValid(); }
        std::vector<std::string> corruptedKeys() const { return ledger_.keys().corruptedKeys(); }

        dp::Result<ChainState, dp::Error> state() const;

      private:
        const Ledger &ledger_;
    };

    const char *toString(BlockFault fault);
    const char *toString(ChainState state);

} // namespace sealchain::ledger
