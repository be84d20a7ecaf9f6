#pragma once

#include "peerchat/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peerchat::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;

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

    std::map<std::string, Value>& ensure_object() {
        if (type != ValueType::Object) {
            type = ValueType::Object;
            object_value.clear();
            string_value.clear();
        }
        return object_value;
    }

    const std::map<std::string, Value>& as_object() const {
        static const std::map<std::string, Value> empty{};
        return type == ValueType::Object ? object_value : empty;
    }

    std::map<std::string, Value>& as_object() { return ensure_object(); }
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Nested mappings with two-space indentation, '#' comments and scalar values.
Value parse_yaml(const std::string& text);
Value load_document(const std::filesystem::path& path);

Value merge_objects(const Value& base, const Value& overlay);
// Profiles may inherit from another profile through an "extends" key.
Value resolve_profile(const Value& profiles, const std::string& profile_name);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);

// Built-in defaults derived from $USER and $HOME.
Config default_config();

// Applies the root keys of document and then, when given, the named profile.
void apply_document(const Value& document, const std::optional<std::string>& profile, Config& config);
void load_config_file(const std::filesystem::path& path, const std::optional<std::string>& profile, Config& config);

}  // namespace peerchat::config
