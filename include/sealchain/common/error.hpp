#pragma once

#include <datapod/datapod.hpp>

namespace sealchain {

    // ===========================================
    // Sealchain-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_BLOCK = 101;
    constexpr dp::u32 ERR_HASH_FAILED = 104;
    constexpr dp::u32 ERR_INVALID_CONFIG = 105;
    constexpr dp::u32 ERR_SIGNING_FAILED = 106;
    constexpr dp::u32 ERR_KEY_MISSING = 107;
    constexpr dp::u32 ERR_MERKLE_EMPTY = 110;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_block(const dp::String &msg = "Invalid block") {
        return dp::Error{ERR_INVALID_BLOCK, msg};
    }

    inline dp::Error hash_failed(const dp::String &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, msg};
    }

    inline dp::Error invalid_config(const dp::String &msg = "Invalid ledger configuration") {
        return dp::Error{ERR_INVALID_CONFIG, msg};
    }

    inline dp::Error signing_failed(const dp::String &msg = "Signing operation failed") {
        return dp::Error{ERR_SIGNING_FAILED, msg};
    }

    inline dp::Error key_missing(const dp::String &msg = "Shared key missing") {
        return dp::Error{ERR_KEY_MISSING, msg};
    }

    inline dp::Error merkle_empty(const dp::String &msg = "Merkle tree is empty") {
        return dp::Error{ERR_MERKLE_EMPTY, msg};
    }

} // namespace sealchain
