#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include "keys.hpp"
#include "value.hpp"

namespace sealchain::ledger {

    inline constexpr const char *SIGNATURE_FIELD = "signature";
    inline constexpr const char *SIGNED_AT_FIELD = "signed_at";
    inline constexpr const char *VERIFICATION_KEY = "verification";

    /// Wraps payloads with a keyed digest over the shared `verification` key.
    ///
    /// signature = SHA-256(canonical(payload) + verification_key). The codec
    /// reads the key ring at call time, so a reset ring takes effect immediately.
    class EnvelopeCodec {
      public:
        explicit EnvelopeCodec(const SharedKeys &keys) : keys_(keys) {}

        /// Copy of `payload` with `signature` and `signed_at` attached. `payload` must be an object.
        dp::Result<Value, dp::Error> sign(const Value &payload) const;

        /// The signed payload when its signature matches, otherwise nothing.
        /// A broken signature and a payload never signed with the current key look the same.
        dp::Result<std::optional<Value>, dp::Error> verifyAndUnwrap(const Value &signed_payload) const;

      private:
        dp::Result<std::string, dp::Error> signatureFor(const Value &payload, const std::string &key) const;

        const SharedKeys &keys_;
    };

} // namespace sealchain::ledger
