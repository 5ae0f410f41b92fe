#pragma once

#include <cstddef>
#include <datapod/datapod.hpp>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sealchain::ledger {

    /// Keyed payload structure carried by blocks, pending entries and envelopes.
    ///
    /// Objects keep their keys in an ordered map, so the canonical rendering is
    /// stable no matter in which order fields were inserted.
    class Value {
      public:
        enum class Kind { Null, Bool, Integer, Real, String, Array, Object };

        using Array = std::vector<Value>;
        using Object = std::map<std::string, Value>;

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool b) : kind_(Kind::Bool), bool_(b) {}
        Value(int v) : kind_(Kind::Integer), int_(v) {}
        Value(dp::i64 v) : kind_(Kind::Integer), int_(v) {}
        Value(double v) : kind_(Kind::Real), real_(v) {}
        Value(const char *s) : kind_(Kind::String), string_(s) {}
        Value(std::string s) : kind_(Kind::String), string_(std::move(s)) {}
        Value(Array a) : kind_(Kind::Array), array_(std::move(a)) {}
        Value(Object o) : kind_(Kind::Object), object_(std::move(o)) {}

        static Value object(std::initializer_list<std::pair<const std::string, Value>> fields = {});
        static Value array(std::initializer_list<Value> items = {});

        Kind kind() const { return kind_; }
        bool isNull() const { return kind_ == Kind::Null; }
        bool isBool() const { return kind_ == Kind::Bool; }
        bool isInteger() const { return kind_ == Kind::Integer; }
        bool isReal() const { return kind_ == Kind::Real; }
        bool isString() const { return kind_ == Kind::String; }
        bool isArray() const { return kind_ == Kind::Array; }
        bool isObject() const { return kind_ == Kind::Object; }

        // Typed accessors throw std::runtime_error on a kind mismatch
        bool asBool() const;
        dp::i64 asInt() const;
        double asReal() const;
        const std::string &asString() const;
        const Array &asArray() const;
        Array &asArray();
        const Object &asObject() const;
        Object &asObject();

        // Object helpers
        bool contains(const std::string &key) const;
        const Value *find(const std::string &key) const;
        Value *find(const std::string &key);
        const Value &at(const std::string &key) const;
        Value &at(const std::string &key);
        Value &operator[](const std::string &key);
        void set(const std::string &key, Value value);
        bool erase(const std::string &key);

        // Array helpers
        void push_back(Value value);
        const Value &at(size_t position) const;
        Value &at(size_t position);

        size_t size() const;

        /// Deterministic JSON rendering: keys sorted, `", "` and `": "` separators.
        std::string canonical() const;

        bool operator==(const Value &other) const;
        bool operator!=(const Value &other) const { return !(*this == other); }

      private:
        void canonicalInto(std::string &out) const;

        Kind kind_{Kind::Null};
        bool bool_{false};
        dp::i64 int_{0};
        double real_{0.0};
        std::string string_{};
        Array array_{};
        Object object_{};
    };

    std::string escapeJson(const std::string &str);

} // namespace sealchain::ledger
