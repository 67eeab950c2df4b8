#include "recdecrypt/json.hpp"

#include <cctype>
#include <cstdio>
#include <limits>
#include <utility>

namespace recdecrypt::json {

namespace {

constexpr int kMaxDepth = 64;

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void EscapeString(std::string& out, const std::string& value) {
    out.push_back('"');
    for (unsigned char ch : value) {
        switch (ch) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (ch < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", ch);
                out += buffer;
            } else {
                out.push_back(static_cast<char>(ch));
            }
        }
    }
    out.push_back('"');
}

void DumpInto(std::string& out, const Value& value) {
    switch (value.type()) {
    case Value::Type::Null:
        out += "null";
        break;
    case Value::Type::Bool:
        out += value.AsBool() ? "true" : "false";
        break;
    case Value::Type::Number:
        out += value.NumberText();
        break;
    case Value::Type::String:
        EscapeString(out, value.AsString());
        break;
    case Value::Type::Array: {
        out.push_back('[');
        const auto& items = value.items();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            DumpInto(out, items[i]);
        }
        out.push_back(']');
        break;
    }
    case Value::Type::Object: {
        out.push_back('{');
        const auto& keys = value.keys();
        const auto& items = value.items();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            EscapeString(out, keys[i]);
            out.push_back(':');
            DumpInto(out, items[i]);
        }
        out.push_back('}');
        break;
    }
    }
}

}  // namespace

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value ParseDocument() {
        Value value = ParseValue(0);
        SkipWhitespace();
        if (pos_ != text_.size()) {
            Fail("trailing characters");
        }
        return value;
    }

private:
    [[noreturn]] void Fail(const std::string& what) const {
        throw Error("invalid JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    void SkipWhitespace() {
        while (pos_ < text_.size()) {
            char ch = text_[pos_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
                break;
            }
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void ExpectLiteral(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) != literal) {
            Fail("unexpected token");
        }
        pos_ += literal.size();
    }

    Value ParseValue(int depth) {
        if (depth > kMaxDepth) {
            Fail("nesting too deep");
        }
        SkipWhitespace();
        if (pos_ >= text_.size()) {
            Fail("unexpected end of input");
        }
        char ch = text_[pos_];
        Value value;
        switch (ch) {
        case 'n':
            ExpectLiteral("null");
            return value;
        case 't':
            ExpectLiteral("true");
            return Value::MakeBool(true);
        case 'f':
            ExpectLiteral("false");
            return Value::MakeBool(false);
        case '"':
            return Value::MakeString(ParseString());
        case '[':
            return ParseArray(depth);
        case '{':
            return ParseObject(depth);
        default:
            if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
                value.type_ = Value::Type::Number;
                value.text_ = ParseNumber();
                return value;
            }
            Fail("unexpected character");
        }
    }

    std::string ParseNumber() {
        std::size_t start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        auto digits = [this]() {
            std::size_t begin = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            return pos_ - begin;
        };
        if (pos_ < text_.size() && text_[pos_] == '0') {
            ++pos_;
        } else if (digits() == 0) {
            Fail("malformed number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            if (digits() == 0) {
                Fail("malformed fraction");
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            if (digits() == 0) {
                Fail("malformed exponent");
            }
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::uint32_t ParseHex4() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated unicode escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                Fail("bad unicode escape");
            }
        }
        return value;
    }

    std::string ParseString() {
        ++pos_;  // opening quote
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                Fail("unterminated string");
            }
            unsigned char ch = static_cast<unsigned char>(text_[pos_++]);
            if (ch == '"') {
                return out;
            }
            if (ch < 0x20) {
                Fail("control character in string");
            }
            if (ch != '\\') {
                out.push_back(static_cast<char>(ch));
                continue;
            }
            if (pos_ >= text_.size()) {
                Fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                std::uint32_t cp = ParseHex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (text_.substr(pos_, 2) != "\\u") {
                        Fail("unpaired surrogate");
                    }
                    pos_ += 2;
                    std::uint32_t low = ParseHex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        Fail("invalid low surrogate");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    Fail("unpaired surrogate");
                }
                AppendUtf8(out, cp);
                break;
            }
            default:
                Fail("unknown escape");
            }
        }
    }

    Value ParseArray(int depth) {
        ++pos_;
        Value array = Value::MakeArray();
        if (Consume(']')) {
            return array;
        }
        while (true) {
            array.Push(ParseValue(depth + 1));
            if (Consume(',')) {
                continue;
            }
            if (Consume(']')) {
                return array;
            }
            Fail("expected ',' or ']'");
        }
    }

    Value ParseObject(int depth) {
        ++pos_;
        Value object = Value::MakeObject();
        if (Consume('}')) {
            return object;
        }
        while (true) {
            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                Fail("expected object key");
            }
            std::string key = ParseString();
            if (!Consume(':')) {
                Fail("expected ':'");
            }
            object.Set(std::move(key), ParseValue(depth + 1));
            if (Consume(',')) {
                continue;
            }
            if (Consume('}')) {
                return object;
            }
            Fail("expected ',' or '}'");
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

const char* TypeName(Value::Type type) {
    switch (type) {
    case Value::Type::Null:
        return "null";
    case Value::Type::Bool:
        return "bool";
    case Value::Type::Number:
        return "number";
    case Value::Type::String:
        return "string";
    case Value::Type::Array:
        return "array";
    case Value::Type::Object:
        return "object";
    }
    return "unknown";
}

Value Value::MakeBool(bool value) {
    Value out;
    out.type_ = Type::Bool;
    out.bool_ = value;
    return out;
}

Value Value::MakeUint(std::uint64_t value) {
    Value out;
    out.type_ = Type::Number;
    out.text_ = std::to_string(value);
    return out;
}

Value Value::MakeString(std::string value) {
    Value out;
    out.type_ = Type::String;
    out.text_ = std::move(value);
    return out;
}

Value Value::MakeArray() {
    Value out;
    out.type_ = Type::Array;
    return out;
}

Value Value::MakeObject() {
    Value out;
    out.type_ = Type::Object;
    return out;
}

void Value::Expect(Type type, const char* what) const {
    if (type_ != type) {
        throw Error(std::string("expected ") + what + ", found " + TypeName(type_));
    }
}

bool Value::AsBool() const {
    Expect(Type::Bool, "bool");
    return bool_;
}

const std::string& Value::AsString() const {
    Expect(Type::String, "string");
    return text_;
}

std::uint64_t Value::AsUint64() const {
    Expect(Type::Number, "number");
    if (text_.empty()) {
        throw Error("empty number");
    }
    std::uint64_t value = 0;
    for (char ch : text_) {
        if (ch < '0' || ch > '9') {
            throw Error("expected unsigned integer, found " + text_);
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw Error("integer out of range: " + text_);
        }
        value = value * 10 + digit;
    }
    return value;
}

const std::string& Value::NumberText() const {
    Expect(Type::Number, "number");
    return text_;
}

const std::vector<Value>& Value::items() const {
    if (type_ != Type::Object) {
        Expect(Type::Array, "array");
    }
    return items_;
}

const std::vector<std::string>& Value::keys() const {
    Expect(Type::Object, "object");
    return keys_;
}

const Value* Value::Find(std::string_view key) const {
    Expect(Type::Object, "object");
    // Duplicate keys resolve to the last occurrence.
    for (std::size_t i = keys_.size(); i > 0; --i) {
        if (keys_[i - 1] == key) {
            return &items_[i - 1];
        }
    }
    return nullptr;
}

void Value::Push(Value value) {
    Expect(Type::Array, "array");
    items_.push_back(std::move(value));
}

void Value::Set(std::string key, Value value) {
    Expect(Type::Object, "object");
    keys_.push_back(std::move(key));
    items_.push_back(std::move(value));
}

Value Parse(std::string_view text) {
    return Parser(text).ParseDocument();
}

std::string Dump(const Value& value) {
    std::string out;
    DumpInto(out, value);
    return out;
}

}  // namespace recdecrypt::json
