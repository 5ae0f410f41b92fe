#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sealchain::ledger {

    inline constexpr const char *DEFAULT_KEY_PREFIX = "NB_KEY_5G_";

    /// Deterministic demo key ring shared by every participant
    std::map<std::string, std::string> defaultSharedKeys();

    /// Named symmetric keys used by the envelope codec.
    ///
    /// Each value must start with `prefix + UPPER(name) + "_"`. The ring keeps
    /// the values it was configured with so a corrupted ring can be restored.
    class SharedKeys {
      private:
        std::string prefix_{DEFAULT_KEY_PREFIX};
        std::map<std::string, std::string> canonical_{};
        std::map<std::string, std::string> current_{};

      public:
        SharedKeys() = default;
        explicit SharedKeys(std::map<std::string, std::string> keys, std::string prefix = DEFAULT_KEY_PREFIX);

        const std::string &prefix() const { return prefix_; }
        const std::map<std::string, std::string> &entries() const { return current_; }
        const std::map<std::string, std::string> &canonicalEntries() const { return canonical_; }

        std::optional<std::string> get(const std::string &name) const;
        void set(const std::string &name, std::string value);

        std::string expectedPrefix(const std::string &name) const;
        bool isWellFormed(const std::string &name) const;

        /// Names whose value no longer matches its prefix pattern, in name order
        std::vector<std::string> corruptedKeys() const;
        bool isValid() const { return corruptedKeys().empty(); }

        void resetToCanonical() { current_ = canonical_; }
    };

} // namespace sealchain::ledger
