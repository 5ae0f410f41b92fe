#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "sealchain/common/error.hpp"

namespace sealchain::ledger {

    /// Highest accepted sealing difficulty (16^8 expected digests per seal)
    inline constexpr int MAX_DIFFICULTY = 8;

    /// SHA-256 of `data`, hex encoded (64 lowercase characters)
    inline dp::Result<std::string, dp::Error> sha256Hex(const std::string &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<dp::u8> data_vec(data.begin(), data.end());
        auto hash_result = crypto.hash(data_vec);
        if (!hash_result.success) {
            return dp::Result<std::string, dp::Error>::err(
                hash_failed(dp::String(("SHA-256 failed: " + hash_result.error_message).c_str())));
        }
        return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(hash_result.data));
    }

    /// True when `digest` starts with `difficulty` '0' characters
    inline bool meetsDifficulty(const std::string &digest, int difficulty) {
        if (difficulty <= 0)
            return true;
        if (digest.size() < static_cast<size_t>(difficulty))
            return false;
        for (int i = 0; i < difficulty; ++i) {
            if (digest[static_cast<size_t>(i)] != '0')
                return false;
        }
        return true;
    }

} // namespace sealchain::ledger
