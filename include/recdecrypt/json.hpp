#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace recdecrypt::json {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Minimal JSON document model for the recording metadata header. Numbers
// keep their source text so 64-bit integers round-trip exactly; object
// members keep their order.
class Value {
public:
    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Value() = default;

    static Value MakeBool(bool value);
    static Value MakeUint(std::uint64_t value);
    static Value MakeString(std::string value);
    static Value MakeArray();
    static Value MakeObject();

    Type type() const noexcept { return type_; }
    bool is_null() const noexcept { return type_ == Type::Null; }

    // Accessors throw Error on a type mismatch.
    bool AsBool() const;
    const std::string& AsString() const;
    std::uint64_t AsUint64() const;
    const std::string& NumberText() const;
    const std::vector<Value>& items() const;
    const std::vector<std::string>& keys() const;

    // Object member lookup; nullptr when absent. Throws if not an object.
    const Value* Find(std::string_view key) const;

    void Push(Value value);
    void Set(std::string key, Value value);

private:
    friend class Parser;

    void Expect(Type type, const char* what) const;

    Type type_ = Type::Null;
    bool bool_ = false;
    std::string text_;
    std::vector<Value> items_;
    std::vector<std::string> keys_;
};

const char* TypeName(Value::Type type);

Value Parse(std::string_view text);
std::string Dump(const Value& value);

}  // namespace recdecrypt::json
