#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qbot {

// Minimal JSON document model for config and session files (no external deps)
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    const JsonValue* find(const std::string& key) const;

    double get_number(const std::string& key, double def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
    const JsonValue* get_array(const std::string& key) const;
    const JsonValue* get_object(const std::string& key) const;
};

// Throws std::runtime_error naming the offset of the first syntax error.
JsonValue parse_json(const std::string& input);

// Range-checked integer conversions of JSON numbers. Fractions truncate;
// values that do not fit throw std::runtime_error naming the field.
int64_t json_to_int64(double value, const std::string& field);
uint64_t json_to_uint64(double value, const std::string& field);

} // namespace qbot
