#include <algorithm>
#include <cctype>
#include <sealchain/ledger/keys.hpp>
#include <set>

namespace sealchain::ledger {

    std::map<std::string, std::string> defaultSharedKeys() {
        return {{"primary", "NB_KEY_5G_PRIMARY_12345"},
                {"secondary", "NB_KEY_5G_SECONDARY_67890"},
                {"verification", "NB_KEY_5G_VERIFICATION_ABCDE"}};
    }

    SharedKeys::SharedKeys(std::map<std::string, std::string> keys, std::string prefix)
        : prefix_(std::move(prefix)), canonical_(keys), current_(std::move(keys)) {}

    std::optional<std::string> SharedKeys::get(const std::string &name) const {
        auto it = current_.find(name);
        if (it == current_.end())
            return std::nullopt;
        return it->second;
    }

    void SharedKeys::set(const std::string &name, std::string value) { current_[name] = std::move(value); }

    std::string SharedKeys::expectedPrefix(const std::string &name) const {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return prefix_ + upper + "_";
    }

    bool SharedKeys::isWellFormed(const std::string &name) const {
        auto it = current_.find(name);
        if (it == current_.end())
            return false;
        const std::string expected = expectedPrefix(name);
        return it->second.compare(0, expected.size(), expected) == 0;
    }

    std::vector<std::string> SharedKeys::corruptedKeys() const {
        // A configured key that went missing counts as corrupted too
        std::set<std::string> names;
        for (const auto &entry : canonical_)
            names.insert(entry.first);
        for (const auto &entry : current_)
            names.insert(entry.first);

        std::vector<std::string> corrupted;
        for (const auto &name : names) {
            if (!isWellFormed(name))
                corrupted.push_back(name);
        }
        return corrupted;
    }

} // namespace sealchain::ledger
