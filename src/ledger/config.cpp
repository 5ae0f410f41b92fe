#include <sealchain/common/error.hpp>
#include <sealchain/ledger/config.hpp>

namespace sealchain::ledger {

    dp::Result<void, dp::Error> LedgerConfig::validate() const {
        if (difficulty < 0)
            return dp::Result<void, dp::Error>::err(invalid_config("Difficulty must not be negative"));
        if (difficulty > MAX_DIFFICULTY) {
            return dp::Result<void, dp::Error>::err(
                invalid_config(dp::String(("Difficulty above " + std::to_string(MAX_DIFFICULTY)).c_str())));
        }
        if (key_prefix.empty())
            return dp::Result<void, dp::Error>::err(invalid_config("Key prefix must not be empty"));

        if (shared_keys.find("verification") == shared_keys.end())
            return dp::Result<void, dp::Error>::err(key_missing("Shared key ring has no verification key"));

        SharedKeys ring(shared_keys, key_prefix);
        auto corrupted = ring.corruptedKeys();
        if (!corrupted.empty()) {
            return dp::Result<void, dp::Error>::err(
                invalid_config(dp::String(("Shared key " + corrupted.front() + " does not match its prefix").c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace sealchain::ledger
