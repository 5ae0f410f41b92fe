#pragma once

// Umbrella header: `#include <sealchain.hpp>` pulls in the whole ledger core

#include "sealchain/sealchain.hpp"
