#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include "chain.hpp"
#include "envelope.hpp"
#include "value.hpp"

namespace sealchain::ledger {

    inline constexpr const char *DEFAULT_RECORD_TYPE = "network_slice";
    inline constexpr const char *RECORD_TYPE_FIELD = "type";
    inline constexpr const char *RECORD_CONTENT_FIELD = "content";
    inline constexpr const char *RECORD_METADATA_FIELD = "metadata";

    /// Metadata attached to every stored record unless the store is given its own
    Value defaultRecordMetadata();

    /// Signed records kept in a ledger.
    ///
    /// A record is stored as the entry `{type, content, metadata}` where
    /// `content` is the signed envelope. Ledger bookkeeping (`data_id`,
    /// `timestamp`) stays outside the envelope, so the signature can be checked
    /// again whenever the record is read back.
    class SignedStore {
      public:
        explicit SignedStore(Ledger &ledger, Value metadata = defaultRecordMetadata())
            : ledger_(ledger), metadata_(std::move(metadata)) {}

        /// Signs `payload`, queues it as a record and seals every pending entry.
        /// Returns the entry id of the record.
        dp::Result<std::string, dp::Error> store(const Value &payload, const std::string &type = DEFAULT_RECORD_TYPE);

        /// Verified content of record `entry_id`. Nothing when the entry is missing,
        /// is not a record, or its signature no longer matches.
        dp::Result<std::optional<Value>, dp::Error> retrieve(const std::string &entry_id) const;

        /// Verified content of the first record of `type` whose content has `field == value`
        dp::Result<std::optional<Value>, dp::Error> retrieveWhere(const std::string &type, const std::string &field,
                                                                  const Value &value) const;

        const Value &metadata() const { return metadata_; }

      private:
        dp::Result<std::optional<Value>, dp::Error> unwrap(const Value &record) const;

        Ledger &ledger_;
        Value metadata_;
    };

} // namespace sealchain::ledger
