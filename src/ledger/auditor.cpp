#include <sealchain/ledger/auditor.hpp>

namespace sealchain::ledger {

    dp::Result<std::vector<BlockFinding>, dp::Error> IntegrityAuditor::findings() const {
        std::vector<BlockFinding> found;
        for (size_t i = 1; i < ledger_.size(); ++i) {
            auto fault = ledger_.inspectBlock(i);
            if (!fault.is_ok())
                return dp::Result<std::vector<BlockFinding>, dp::Error>::err(fault.error());
            if (fault.value() != BlockFault::None)
                found.push_back(BlockFinding{static_cast<dp::i64>(i), fault.value()});
        }
        return dp::Result<std::vector<BlockFinding>, dp::Error>::ok(std::move(found));
    }

    dp::Result<std::vector<dp::i64>, dp::Error> IntegrityAuditor::detect() const {
        auto found = findings();
        if (!found.is_ok())
            return dp::Result<std::vector<dp::i64>, dp::Error>::err(found.error());
        std::vector<dp::i64> indices;
        indices.reserve(found.value().size());
        for (const auto &finding : found.value())
            indices.push_back(finding.index);
        return dp::Result<std::vector<dp::i64>, dp::Error>::ok(std::move(indices));
    }

    dp::Result<ChainState, dp::Error> IntegrityAuditor::state() const {
        auto indices = detect();
        if (!indices.is_ok())
            return dp::Result<ChainState, dp::Error>::err(indices.error());
        bool clean = indices.value().empty() && !keysCorrupted();
        return dp::Result<ChainState, dp::Error>::ok(clean ? ChainState::Clean : ChainState::Tampered);
    }

    const char *toString(BlockFault fault) {
        switch (fault) {
        case BlockFault::None:
            return "none";
        case BlockFault::HashMismatch:
            return "hash mismatch";
        case BlockFault::BrokenLink:
            return "broken link";
        }
        return "unknown";
    }

    const char *toString(ChainState state) { return state == ChainState::Clean ? "clean" : "tampered"; }

} // namespace sealchain::ledger
