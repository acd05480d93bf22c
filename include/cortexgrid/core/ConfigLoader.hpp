#pragma once

#include "cortexgrid/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cortexgrid::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();
};

struct ConfigError : public std::exception {
    ConfigError(std::string code_value, std::string message_value)
        : code(std::move(code_value)), message(std::move(message_value)) {}

    const char* what() const noexcept override { return message.c_str(); }

    std::string code;
    std::string message;
};

Value parse_yaml(const std::string& text);
Value load_document(const std::filesystem::path& path);

// Overlays the recognised keys of `document` onto `config`.
void apply_document(const Value& document, Config& config);
Config load_config(const std::filesystem::path& path);

}  // namespace cortexgrid::config
