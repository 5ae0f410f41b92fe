#pragma once

// High-level Sealchain facade
// Composes the ledger core

#include "sealchain/common/error.hpp"
#include "sealchain/ledger/ledger.hpp"

// Short alias for call sites
namespace chain = sealchain::ledger;
