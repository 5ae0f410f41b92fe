#pragma once

#include "auditor.hpp"
#include "block.hpp"
#include "chain.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "digest.hpp"
#include "envelope.hpp"
#include "keys.hpp"
#include "merkle.hpp"
#include "repair.hpp"
#include "store.hpp"
#include "value.hpp"

namespace sealchain::ledger {
    // Aggregates ledger headers under sealchain::ledger
}
