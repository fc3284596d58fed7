#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace restprobe::json {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    // Integer literal beyond the int64 range, kept digit for digit next to its
    // double approximation.
    std::string number_literal;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    static Value make_array() {
        Value value;
        value.type = ValueType::Array;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }
    bool is_scalar() const { return !is_object() && !is_array(); }

    std::map<std::string, Value>& ensure_object();

    const Value* find(std::string_view key) const;
};

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t offset);

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::size_t offset_;
};

// Parses one complete JSON document. Throws ParseError on malformed input or
// trailing content.
Value parse(std::string_view text);

bool try_parse(std::string_view text, Value& output, std::string& error_message);

}  // namespace restprobe::json
