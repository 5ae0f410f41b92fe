#include <sealchain/common/error.hpp>
#include <sealchain/ledger/clock.hpp>
#include <sealchain/ledger/digest.hpp>
#include <sealchain/ledger/envelope.hpp>

namespace sealchain::ledger {

    dp::Result<std::string, dp::Error> EnvelopeCodec::signatureFor(const Value &payload,
                                                                   const std::string &key) const {
        return sha256Hex(payload.canonical() + key);
    }

    dp::Result<Value, dp::Error> EnvelopeCodec::sign(const Value &payload) const {
        if (!payload.isObject())
            return dp::Result<Value, dp::Error>::err(signing_failed("Only keyed payloads can be signed"));
        auto key = keys_.get(VERIFICATION_KEY);
        if (!key)
            return dp::Result<Value, dp::Error>::err(key_missing("No verification key to sign with"));

        auto signature = signatureFor(payload, *key);
        if (!signature.is_ok())
            return dp::Result<Value, dp::Error>::err(signature.error());

        Value signed_payload = payload;
        signed_payload.set(SIGNATURE_FIELD, signature.value());
        signed_payload.set(SIGNED_AT_FIELD, Timestamp::now().iso8601());
        return dp::Result<Value, dp::Error>::ok(std::move(signed_payload));
    }

    dp::Result<std::optional<Value>, dp::Error> EnvelopeCodec::verifyAndUnwrap(const Value &signed_payload) const {
        using VerifyResult = dp::Result<std::optional<Value>, dp::Error>;

        const Value *stored = signed_payload.find(SIGNATURE_FIELD);
        if (!stored || !stored->isString())
            return VerifyResult::ok(std::optional<Value>{});
        auto key = keys_.get(VERIFICATION_KEY);
        if (!key)
            return VerifyResult::ok(std::optional<Value>{});

        Value unsigned_payload = signed_payload;
        unsigned_payload.erase(SIGNATURE_FIELD);
        unsigned_payload.erase(SIGNED_AT_FIELD);

        auto expected = signatureFor(unsigned_payload, *key);
        if (!expected.is_ok())
            return VerifyResult::err(expected.error());
        if (stored->asString() != expected.value())
            return VerifyResult::ok(std::optional<Value>{});
        return VerifyResult::ok(std::optional<Value>(signed_payload));
    }

} // namespace sealchain::ledger
