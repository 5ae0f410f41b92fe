#include <iostream>
#include <sealchain/common/error.hpp>
#include <sealchain/ledger/chain.hpp>

namespace sealchain::ledger {

    Ledger::Ledger(LedgerConfig config)
        : config_(std::move(config)), keys_(config_.shared_keys, config_.key_prefix) {}

    dp::Result<Ledger, dp::Error> Ledger::create(LedgerConfig config) {
        auto valid = config.validate();
        if (!valid.is_ok())
            return dp::Result<Ledger, dp::Error>::err(valid.error());

        Ledger ledger(std::move(config));
        auto genesis = ledger.createGenesis();
        if (!genesis.is_ok())
            return dp::Result<Ledger, dp::Error>::err(genesis.error());
        return dp::Result<Ledger, dp::Error>::ok(std::move(ledger));
    }

    dp::Result<void, dp::Error> Ledger::createGenesis() {
        auto block_result = Block::create(0, Timestamp::now(), config_.genesis_payload, GENESIS_PREVIOUS_HASH);
        if (!block_result.is_ok())
            return dp::Result<void, dp::Error>::err(block_result.error());
        Block genesis = std::move(block_result.value());
        auto mined = genesis.mine(config_.difficulty);
        if (!mined.is_ok())
            return dp::Result<void, dp::Error>::err(mined.error());
        blocks_.push_back(std::move(genesis));
        if (config_.verbose)
            std::cout << "Genesis block sealed: " << blocks_.back().hash_.substr(0, 16) << "..." << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    std::string Ledger::enqueue(Value payload) {
        Value entry = payload.isObject() ? std::move(payload) : Value::object({{"value", std::move(payload)}});
        std::string entry_id = generateEntryId();
        entry.set("data_id", entry_id);
        entry.set("timestamp", Timestamp::now().iso8601());
        pending_.push_back(std::move(entry));
        return entry_id;
    }

    dp::Result<std::optional<Block>, dp::Error> Ledger::sealPending() {
        if (pending_.empty())
            return dp::Result<std::optional<Block>, dp::Error>::ok(std::optional<Block>{});

        auto root = merkleRoot(pending_);
        if (!root.is_ok())
            return dp::Result<std::optional<Block>, dp::Error>::err(root.error());

        Value data = Value::object({{"entries", Value(Value::Array(pending_))}, {"merkle_root", root.value()}});
        const Block &latest = latestBlock();
        auto block_result = Block::create(latest.index_ + 1, Timestamp::now(), std::move(data), latest.hash_);
        if (!block_result.is_ok())
            return dp::Result<std::optional<Block>, dp::Error>::err(block_result.error());

        Block block = std::move(block_result.value());
        auto mined = block.mine(config_.difficulty);
        if (!mined.is_ok())
            return dp::Result<std::optional<Block>, dp::Error>::err(mined.error());

        if (config_.verbose) {
            std::cout << "Block " << block.index_ << " sealed with " << pending_.size() << " entries after "
                      << mined.value() << " attempts: " << block.hash_.substr(0, 16) << "..." << std::endl;
        }
        blocks_.push_back(std::move(block));
        pending_.clear();
        return dp::Result<std::optional<Block>, dp::Error>::ok(std::optional<Block>(blocks_.back()));
    }

    dp::Result<BlockFault, dp::Error> Ledger::inspectBlock(size_t index) const {
        if (index >= blocks_.size())
            return dp::Result<BlockFault, dp::Error>::err(dp::Error::out_of_range("Block index out of range"));
        if (index == 0)
            return dp::Result<BlockFault, dp::Error>::ok(BlockFault::None);

        const Block &current = blocks_[index];
        auto matches = current.hashMatches();
        if (!matches.is_ok())
            return dp::Result<BlockFault, dp::Error>::err(matches.error());
        if (!matches.value())
            return dp::Result<BlockFault, dp::Error>::ok(BlockFault::HashMismatch);
        if (current.previous_hash_ != blocks_[index - 1].hash_)
            return dp::Result<BlockFault, dp::Error>::ok(BlockFault::BrokenLink);
        return dp::Result<BlockFault, dp::Error>::ok(BlockFault::None);
    }

    dp::Result<Verification, dp::Error> Ledger::verify() const {
        for (size_t i = 1; i < blocks_.size(); ++i) {
            auto fault = inspectBlock(i);
            if (!fault.is_ok())
                return dp::Result<Verification, dp::Error>::err(fault.error());
            switch (fault.value()) {
            case BlockFault::HashMismatch:
                return dp::Result<Verification, dp::Error>::ok(
                    Verification{false, "Block " + std::to_string(i) + " hash invalid"});
            case BlockFault::BrokenLink:
                return dp::Result<Verification, dp::Error>::ok(
                    Verification{false, "Block " + std::to_string(i) + " not connected to previous block"});
            case BlockFault::None:
                break;
            }
        }

        auto corrupted = keys_.corruptedKeys();
        if (!corrupted.empty()) {
            return dp::Result<Verification, dp::Error>::ok(
                Verification{false, "Shared key " + corrupted.front() + " has been tampered with"});
        }
        return dp::Result<Verification, dp::Error>::ok(Verification{true, "Ledger verification successful"});
    }

    std::optional<Value> Ledger::findEntry(const std::string &entry_id) const {
        for (const auto &block : blocks_) {
            const Value *entries = block.data_.find("entries");
            if (!entries || !entries->isArray())
                continue;
            for (const auto &entry : entries->asArray()) {
                const Value *id = entry.find("data_id");
                if (id && id->isString() && id->asString() == entry_id)
                    return entry;
            }
        }
        return std::nullopt;
    }

    dp::Result<MerkleProof, dp::Error> Ledger::proveEntry(size_t block_index, size_t entry_position) const {
        if (block_index >= blocks_.size())
            return dp::Result<MerkleProof, dp::Error>::err(dp::Error::out_of_range("Block index out of range"));
        const Value *entries = blocks_[block_index].data_.find("entries");
        if (!entries || !entries->isArray())
            return dp::Result<MerkleProof, dp::Error>::err(invalid_block("Block carries no entries"));
        if (entry_position >= entries->size())
            return dp::Result<MerkleProof, dp::Error>::err(dp::Error::out_of_range("Entry position out of range"));

        auto tree = MerkleTree::fromEntries(entries->asArray());
        if (!tree.is_ok())
            return dp::Result<MerkleProof, dp::Error>::err(tree.error());
        return tree.value().getProof(entry_position);
    }

    dp::Result<bool, dp::Error> Ledger::verifyEntryInclusion(size_t block_index, size_t entry_position) const {
        auto proof = proveEntry(block_index, entry_position);
        if (!proof.is_ok())
            return dp::Result<bool, dp::Error>::err(proof.error());
        const Block &block = blocks_[block_index];
        const Value &entry = block.data_.at("entries").at(entry_position);
        return MerkleTree::verifyProof(entry.canonical(), proof.value(), block.merkleRoot());
    }

    dp::Result<Block, dp::Error> Ledger::blockAt(size_t index) const {
        if (index >= blocks_.size())
            return dp::Result<Block, dp::Error>::err(dp::Error::out_of_range("Block index out of range"));
        return dp::Result<Block, dp::Error>::ok(blocks_[index]);
    }

    Value Ledger::chainData() const {
        Value::Array chain;
        chain.reserve(blocks_.size());
        for (const auto &block : blocks_)
            chain.push_back(block.toValue());
        return Value(std::move(chain));
    }

} // namespace sealchain::ledger
