#include <iostream>
#include <sealchain/sealchain.hpp>
#include <string>
#include <vector>

int main() {
    std::cout << "=== Slice Ledger Demo ===" << std::endl;

    // 1. Ledger with a visible sealing log
    std::cout << "\n1. Creating ledger..." << std::endl;
    auto config = chain::LedgerConfig::defaults();
    config.difficulty = 3;
    config.verbose = true;

    auto ledger_result = chain::Ledger::create(config);
    if (!ledger_result.is_ok()) {
        std::cerr << "Failed to create ledger: " << ledger_result.error().message.c_str() << std::endl;
        return 1;
    }
    auto ledger = std::move(ledger_result.value());

    // 2. Slice requests are stored as signed records, one block each
    std::cout << "\n2. Storing signed slice records..." << std::endl;
    chain::SignedStore store(ledger);
    std::vector<chain::Value> requests = {
        chain::Value::object({{"slice_id", "e1"}, {"slice_type", "eMBB"}, {"priority", 100}}),
        chain::Value::object({{"slice_id", "c1"}, {"slice_type", "URLLC"}, {"priority", 50}}),
        chain::Value::object({{"slice_id", "m1"}, {"slice_type", "mMTC"}, {"priority", 10}})};

    std::vector<std::string> entry_ids;
    for (const auto &request : requests) {
        auto stored = store.store(request);
        if (!stored.is_ok()) {
            std::cerr << "   Failed to store: " << stored.error().message.c_str() << std::endl;
            return 1;
        }
        entry_ids.push_back(stored.value());
        std::cout << "   Stored " << request.at("slice_id").asString() << " as " << entry_ids.back() << std::endl;
    }

    // 3. Read the records back, checking their signatures
    std::cout << "\n3. Retrieving slice records..." << std::endl;
    for (const auto &id : entry_ids) {
        auto retrieved = store.retrieve(id);
        if (!retrieved.is_ok()) {
            std::cerr << "   Retrieval error: " << retrieved.error().message.c_str() << std::endl;
            return 1;
        }
        if (retrieved.value().has_value())
            std::cout << "   " << retrieved.value()->at("slice_id").asString() << ": signature valid" << std::endl;
        else
            std::cout << "   " << id << ": signature INVALID" << std::endl;
    }

    // 4. Inclusion proofs
    std::cout << "\n4. Proving entry inclusion..." << std::endl;
    for (size_t index = 1; index < ledger.size(); ++index) {
        auto included = ledger.verifyEntryInclusion(index, 0);
        if (!included.is_ok()) {
            std::cerr << "   Proof failed: " << included.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "   Block " << index << ": " << (included.value() ? "included" : "NOT included") << std::endl;
    }

    // 5. Verify and audit
    std::cout << "\n5. Verifying ledger..." << std::endl;
    auto verified = ledger.verify();
    if (!verified.is_ok()) {
        std::cerr << "   Verification error: " << verified.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   " << verified.value().message << std::endl;

    chain::RepairEngine engine(ledger);
    auto state = engine.state();
    if (state.is_ok())
        std::cout << "   Chain state: " << chain::toString(state.value()) << std::endl;

    auto report = engine.autoRepairIfNeeded();
    if (!report.is_ok()) {
        std::cerr << "   Repair error: " << report.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   " << report.value().message << std::endl;

    // 6. Export
    std::cout << "\n6. Chain summary:" << std::endl;
    for (const auto &block : ledger.blocks()) {
        std::cout << "   Block " << block.index_ << " nonce=" << block.nonce_ << " hash=" << block.hash_.substr(0, 16)
                  << "... entries=" << block.entryCount() << std::endl;
    }

    auto found = ledger.findEntry(entry_ids.front());
    if (found)
        std::cout << "\n   First entry: " << found->canonical() << std::endl;

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
