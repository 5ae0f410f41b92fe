#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <string>

#include "digest.hpp"
#include "keys.hpp"
#include "value.hpp"

namespace sealchain::ledger {

    /// Ledger configuration
    struct LedgerConfig {
        // Required leading '0' hex characters in every sealed digest
        int difficulty = 2;

        // Shared key ring, each value prefixed with key_prefix + UPPER(name) + "_"
        std::string key_prefix = DEFAULT_KEY_PREFIX;
        std::map<std::string, std::string> shared_keys = defaultSharedKeys();

        // Payload sealed into block 0
        Value genesis_payload = Value::object({{"message", "Genesis Block"}, {"source", "sealchain"}});

        // Print sealing and repair events to stdout
        bool verbose = false;

        static LedgerConfig defaults() { return LedgerConfig{}; }

        dp::Result<void, dp::Error> validate() const;
    };

} // namespace sealchain::ledger
