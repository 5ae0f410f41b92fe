#include <algorithm>
#include <iostream>
#include <sealchain/ledger/clock.hpp>
#include <sealchain/ledger/merkle.hpp>
#include <sealchain/ledger/repair.hpp>
#include <sstream>

namespace sealchain::ledger {

    namespace {

        std::string joinIndices(const std::vector<dp::i64> &indices) {
            std::ostringstream ss;
            ss << "[";
            for (size_t i = 0; i < indices.size(); ++i) {
                if (i > 0)
                    ss << ", ";
                ss << indices[i];
            }
            ss << "]";
            return ss.str();
        }

        // Aggregated blocks commit to their entries; keep the stored root in step with them
        dp::Result<void, dp::Error> refreshMerkleRoot(Block &block) {
            const Value *entries = block.data_.find("entries");
            if (!entries || !entries->isArray() || entries->size() == 0 || !block.data_.contains("merkle_root"))
                return dp::Result<void, dp::Error>::ok();
            auto root = merkleRoot(entries->asArray());
            if (!root.is_ok())
                return dp::Result<void, dp::Error>::err(root.error());
            block.data_.set("merkle_root", root.value());
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    ChainSnapshot snapshot(const Ledger &ledger) {
        ChainSnapshot states;
        states.reserve(ledger.size());
        for (const auto &block : ledger.blocks())
            states.push_back(BlockState{block.index_, block.hash_, block.previous_hash_, block.nonce_});
        return states;
    }

    dp::Result<RepairReport, dp::Error> RepairEngine::repair() {
        const bool verbose = ledger_.config_.verbose;
        IntegrityAuditor auditor(ledger_);

        RepairReport report;
        report.before = snapshot(ledger_);
        std::vector<std::string> actions;

        if (auditor.keysCorrupted()) {
            if (verbose)
                std::cout << "Resetting shared keys: " << auditor.corruptedKeys().size() << " malformed" << std::endl;
            ledger_.keys_.resetToCanonical();
            report.keys_reset = true;
            actions.push_back("Fixed shared key verification issue");
        }

        auto detected = auditor.detect();
        if (!detected.is_ok())
            return dp::Result<RepairReport, dp::Error>::err(detected.error());
        report.affected_indices = detected.value();

        if (report.affected_indices.empty() && !report.keys_reset) {
            report.success = true;
            report.message = "Chain integrity intact, no repairs needed";
            report.after = report.before;
            return dp::Result<RepairReport, dp::Error>::ok(std::move(report));
        }

        if (!report.affected_indices.empty()) {
            const dp::i64 start = *std::min_element(report.affected_indices.begin(), report.affected_indices.end());
            auto &blocks = ledger_.blocks_;
            for (size_t i = static_cast<size_t>(std::max<dp::i64>(start, 1)); i < blocks.size(); ++i) {
                Block &block = blocks[i];
                block.previous_hash_ = blocks[i - 1].hash_;
                auto rooted = refreshMerkleRoot(block);
                if (!rooted.is_ok())
                    return dp::Result<RepairReport, dp::Error>::err(rooted.error());
                auto mined = block.mine(ledger_.difficulty());
                if (!mined.is_ok())
                    return dp::Result<RepairReport, dp::Error>::err(mined.error());
                report.repaired_indices.push_back(static_cast<dp::i64>(i));
                if (verbose)
                    std::cout << "Repaired block " << i << ", new hash: " << block.hash_.substr(0, 10) << "..."
                              << std::endl;
            }
            actions.push_back("Fixed " + std::to_string(report.repaired_indices.size()) + " blocks " +
                              joinIndices(report.repaired_indices));
        }

        ledger_.repair_history_.push_back(
            RepairRecord{Timestamp::now().iso8601(), REPAIR_REASON, report.affected_indices, report.keys_reset});

        std::string message;
        for (size_t i = 0; i < actions.size(); ++i) {
            if (i > 0)
                message += "; ";
            message += actions[i];
        }
        report.success = true;
        report.message = message;
        report.after = snapshot(ledger_);
        return dp::Result<RepairReport, dp::Error>::ok(std::move(report));
    }

    dp::Result<RepairReport, dp::Error> RepairEngine::autoRepairIfNeeded() {
        auto initial = ledger_.verify();
        if (!initial.is_ok())
            return dp::Result<RepairReport, dp::Error>::err(initial.error());
        if (initial.value().valid) {
            RepairReport report;
            report.success = true;
            report.message = "No repairs needed";
            report.before = snapshot(ledger_);
            report.after = report.before;
            return dp::Result<RepairReport, dp::Error>::ok(std::move(report));
        }

        auto repaired = repair();
        if (!repaired.is_ok())
            return dp::Result<RepairReport, dp::Error>::err(repaired.error());
        RepairReport report = std::move(repaired.value());

        auto after = ledger_.verify();
        if (!after.is_ok())
            return dp::Result<RepairReport, dp::Error>::err(after.error());
        if (after.value().valid) {
            report.message = "Chain repaired successfully: " + report.message;
        } else {
            report.success = false;
            report.message = "Repair attempted but issues remain: " + after.value().message;
        }
        return dp::Result<RepairReport, dp::Error>::ok(std::move(report));
    }

} // namespace sealchain::ledger
