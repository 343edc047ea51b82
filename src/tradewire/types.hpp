#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <map>
#include <any>
#include <optional>
#include <cstdint>

namespace tradewire {

// Value type for loosely-typed protocol data
using Value = std::any;
using Dict = std::map<std::string, Value>;
using List = std::vector<Value>;

// Ordered field names of a message type
using FieldShape = std::vector<std::string>;

// Helper to get value from std::any
template<typename T>
std::optional<T> get_as(const Value& v) {
    try {
        return std::any_cast<T>(v);
    } catch (const std::bad_any_cast&) {
        return std::nullopt;
    }
}

// Integral value of any width or signedness (bool excluded)
bool is_integer(const Value& v);
std::optional<int64_t> as_integer(const Value& v);

// std::string, std::string_view or const char*
bool is_string(const Value& v);
std::optional<std::string> as_string(const Value& v);

// Human-readable rendering used in logs and message printing.
// Empty values render as "null", strings are quoted, nested lists
// and dicts are rendered recursively.
std::string value_to_string(const Value& v);

// Pairs positional values with field names in shape order. Surplus
// values are dropped; fields without a value are left out.
Dict zip_fields(const FieldShape& shape, const List& values);

// Converts scalar text (e.g. a YAML scalar) into the narrowest Value:
// int64_t, double, bool or std::string
Value parse_scalar(const std::string& text);

} // namespace tradewire
