#include <iostream>
#include <sealchain/ledger/store.hpp>

namespace sealchain::ledger {

    Value defaultRecordMetadata() {
        return Value::object({{"source", "sealchain"}, {"category", "network_configuration"}, {"version", "1.0"}});
    }

    dp::Result<std::string, dp::Error> SignedStore::store(const Value &payload, const std::string &type) {
        EnvelopeCodec codec(ledger_.keys());
        auto envelope = codec.sign(payload);
        if (!envelope.is_ok())
            return dp::Result<std::string, dp::Error>::err(envelope.error());

        std::string entry_id = ledger_.enqueue(Value::object({{RECORD_TYPE_FIELD, type},
                                                              {RECORD_CONTENT_FIELD, std::move(envelope.value())},
                                                              {RECORD_METADATA_FIELD, metadata_}}));
        auto sealed = ledger_.sealPending();
        if (!sealed.is_ok())
            return dp::Result<std::string, dp::Error>::err(sealed.error());

        if (ledger_.config().verbose)
            std::cout << "Stored " << type << " record " << entry_id << " in block " << ledger_.latestBlock().index_
                      << std::endl;
        return dp::Result<std::string, dp::Error>::ok(std::move(entry_id));
    }

    dp::Result<std::optional<Value>, dp::Error> SignedStore::unwrap(const Value &record) const {
        const Value *content = record.find(RECORD_CONTENT_FIELD);
        if (!content || !content->isObject())
            return dp::Result<std::optional<Value>, dp::Error>::ok(std::optional<Value>{});
        return EnvelopeCodec(ledger_.keys()).verifyAndUnwrap(*content);
    }

    dp::Result<std::optional<Value>, dp::Error> SignedStore::retrieve(const std::string &entry_id) const {
        auto record = ledger_.findEntry(entry_id);
        if (!record)
            return dp::Result<std::optional<Value>, dp::Error>::ok(std::optional<Value>{});
        return unwrap(*record);
    }

    dp::Result<std::optional<Value>, dp::Error>
    SignedStore::retrieveWhere(const std::string &type, const std::string &field, const Value &value) const {
        for (const auto &block : ledger_.blocks()) {
            const Value *entries = block.data_.find("entries");
            if (!entries || !entries->isArray())
                continue;
            for (const auto &entry : entries->asArray()) {
                const Value *entry_type = entry.find(RECORD_TYPE_FIELD);
                if (!entry_type || !entry_type->isString() || entry_type->asString() != type)
                    continue;
                const Value *content = entry.find(RECORD_CONTENT_FIELD);
                const Value *candidate = content ? content->find(field) : nullptr;
                if (candidate && *candidate == value)
                    return unwrap(entry);
            }
        }
        return dp::Result<std::optional<Value>, dp::Error>::ok(std::optional<Value>{});
    }

} // namespace sealchain::ledger
