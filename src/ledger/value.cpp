#include <charconv>
#include <cmath>
#include <cstdio>
#include <sealchain/ledger/value.hpp>
#include <stdexcept>

namespace sealchain::ledger {

    namespace {

        const char *kindName(Value::Kind kind) {
            switch (kind) {
            case Value::Kind::Null:
                return "null";
            case Value::Kind::Bool:
                return "bool";
            case Value::Kind::Integer:
                return "integer";
            case Value::Kind::Real:
                return "real";
            case Value::Kind::String:
                return "string";
            case Value::Kind::Array:
                return "array";
            case Value::Kind::Object:
                return "object";
            }
            return "unknown";
        }

        [[noreturn]] void kindMismatch(Value::Kind expected, Value::Kind actual) {
            throw std::runtime_error(std::string("Value is ") + kindName(actual) + ", expected " + kindName(expected));
        }

        void appendReal(std::string &out, double value) {
            if (std::isnan(value)) {
                out += "NaN";
                return;
            }
            if (std::isinf(value)) {
                out += value > 0 ? "Infinity" : "-Infinity";
                return;
            }
            char buf[64];
            auto res = std::to_chars(buf, buf + sizeof(buf), value);
            std::string text(buf, res.ptr);
            if (text.find_first_of(".e") == std::string::npos)
                text += ".0";
            out += text;
        }

        void appendUnit(std::string &out, unsigned unit) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", unit);
            out += buf;
        }

        bool isContinuation(const std::string &str, size_t pos) {
            return pos < str.size() && (static_cast<unsigned char>(str[pos]) & 0xC0) == 0x80;
        }

        /// Escapes the UTF-8 sequence starting at `pos` as UTF-16 escape units and
        /// returns the bytes consumed. A byte that does not start a valid sequence
        /// becomes the lone surrogate U+DC00+byte, one byte at a time.
        size_t appendCodePoint(std::string &out, const std::string &str, size_t pos) {
            const auto lead = static_cast<unsigned char>(str[pos]);
            size_t length = 0;
            unsigned code = 0;
            unsigned minimum = 0;
            if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
                code = lead & 0x1F;
                minimum = 0x80;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                code = lead & 0x0F;
                minimum = 0x800;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                code = lead & 0x07;
                minimum = 0x10000;
            }

            bool valid = length > 0;
            for (size_t k = 1; valid && k < length; ++k) {
                if (!isContinuation(str, pos + k))
                    valid = false;
                else
                    code = (code << 6) | (static_cast<unsigned char>(str[pos + k]) & 0x3F);
            }
            if (valid && (code < minimum || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)))
                valid = false;

            if (!valid) {
                appendUnit(out, 0xDC00 + lead);
                return 1;
            }
            if (code >= 0x10000) {
                code -= 0x10000;
                appendUnit(out, 0xD800 + (code >> 10));
                appendUnit(out, 0xDC00 + (code & 0x3FF));
            } else {
                appendUnit(out, code);
            }
            return length;
        }

    } // namespace

    std::string escapeJson(const std::string &str) {
        std::string result;
        result.reserve(str.size() + 2);
        size_t i = 0;
        while (i < str.size()) {
            const auto c = static_cast<unsigned char>(str[i]);
            if (c >= 0x80) {
                i += appendCodePoint(result, str, i);
                continue;
            }
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (c < 0x20)
                    appendUnit(result, c);
                else
                    result += static_cast<char>(c);
                break;
            }
            ++i;
        }
        return result;
    }

    Value Value::object(std::initializer_list<std::pair<const std::string, Value>> fields) {
        return Value(Object(fields));
    }

    Value Value::array(std::initializer_list<Value> items) { return Value(Array(items)); }

    bool Value::asBool() const {
        if (kind_ != Kind::Bool)
            kindMismatch(Kind::Bool, kind_);
        return bool_;
    }

    dp::i64 Value::asInt() const {
        if (kind_ != Kind::Integer)
            kindMismatch(Kind::Integer, kind_);
        return int_;
    }

    double Value::asReal() const {
        if (kind_ == Kind::Integer)
            return static_cast<double>(int_);
        if (kind_ != Kind::Real)
            kindMismatch(Kind::Real, kind_);
        return real_;
    }

    const std::string &Value::asString() const {
        if (kind_ != Kind::String)
            kindMismatch(Kind::String, kind_);
        return string_;
    }

    const Value::Array &Value::asArray() const {
        if (kind_ != Kind::Array)
            kindMismatch(Kind::Array, kind_);
        return array_;
    }

    Value::Array &Value::asArray() {
        if (kind_ != Kind::Array)
            kindMismatch(Kind::Array, kind_);
        return array_;
    }

    const Value::Object &Value::asObject() const {
        if (kind_ != Kind::Object)
            kindMismatch(Kind::Object, kind_);
        return object_;
    }

    Value::Object &Value::asObject() {
        if (kind_ != Kind::Object)
            kindMismatch(Kind::Object, kind_);
        return object_;
    }

    bool Value::contains(const std::string &key) const { return find(key) != nullptr; }

    const Value *Value::find(const std::string &key) const {
        if (kind_ != Kind::Object)
            return nullptr;
        auto it = object_.find(key);
        return it == object_.end() ? nullptr : &it->second;
    }

    Value *Value::find(const std::string &key) {
        if (kind_ != Kind::Object)
            return nullptr;
        auto it = object_.find(key);
        return it == object_.end() ? nullptr : &it->second;
    }

    const Value &Value::at(const std::string &key) const {
        const Value *found = find(key);
        if (!found)
            throw std::out_of_range("Missing key: " + key);
        return *found;
    }

    Value &Value::at(const std::string &key) {
        Value *found = find(key);
        if (!found)
            throw std::out_of_range("Missing key: " + key);
        return *found;
    }

    Value &Value::operator[](const std::string &key) {
        if (kind_ == Kind::Null)
            kind_ = Kind::Object;
        return asObject()[key];
    }

    void Value::set(const std::string &key, Value value) { (*this)[key] = std::move(value); }

    bool Value::erase(const std::string &key) {
        if (kind_ != Kind::Object)
            return false;
        return object_.erase(key) > 0;
    }

    void Value::push_back(Value value) {
        if (kind_ == Kind::Null)
            kind_ = Kind::Array;
        asArray().push_back(std::move(value));
    }

    const Value &Value::at(size_t position) const {
        const auto &items = asArray();
        if (position >= items.size())
            throw std::out_of_range("Array position out of range");
        return items[position];
    }

    Value &Value::at(size_t position) {
        auto &items = asArray();
        if (position >= items.size())
            throw std::out_of_range("Array position out of range");
        return items[position];
    }

    size_t Value::size() const {
        switch (kind_) {
        case Kind::Array:
            return array_.size();
        case Kind::Object:
            return object_.size();
        case Kind::String:
            return string_.size();
        default:
            return 0;
        }
    }

    std::string Value::canonical() const {
        std::string out;
        canonicalInto(out);
        return out;
    }

    void Value::canonicalInto(std::string &out) const {
        switch (kind_) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Kind::Integer:
            out += std::to_string(int_);
            break;
        case Kind::Real:
            appendReal(out, real_);
            break;
        case Kind::String:
            out += '"';
            out += escapeJson(string_);
            out += '"';
            break;
        case Kind::Array: {
            out += '[';
            bool first = true;
            for (const auto &item : array_) {
                if (!first)
                    out += ", ";
                item.canonicalInto(out);
                first = false;
            }
            out += ']';
            break;
        }
        case Kind::Object: {
            out += '{';
            bool first = true;
            for (const auto &[key, item] : object_) {
                if (!first)
                    out += ", ";
                out += '"';
                out += escapeJson(key);
                out += "\": ";
                item.canonicalInto(out);
                first = false;
            }
            out += '}';
            break;
        }
        }
    }

    bool Value::operator==(const Value &other) const {
        if (kind_ != other.kind_)
            return false;
        switch (kind_) {
        case Kind::Null:
            return true;
        case Kind::Bool:
            return bool_ == other.bool_;
        case Kind::Integer:
            return int_ == other.int_;
        case Kind::Real:
            return real_ == other.real_;
        case Kind::String:
            return string_ == other.string_;
        case Kind::Array:
            return array_ == other.array_;
        case Kind::Object:
            return object_ == other.object_;
        }
        return false;
    }

} // namespace sealchain::ledger
