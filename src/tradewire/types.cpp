#include "types.hpp"
#include <sstream>
#include <string_view>
#include <charconv>
#include <typeinfo>

namespace tradewire {

namespace {

template<typename T>
bool holds(const Value& v) {
    return v.type() == typeid(T);
}

} // namespace

bool is_integer(const Value& v) {
    return as_integer(v).has_value();
}

std::optional<int64_t> as_integer(const Value& v) {
    if (holds<int>(v)) return std::any_cast<int>(v);
    if (holds<long>(v)) return std::any_cast<long>(v);
    if (holds<long long>(v)) return std::any_cast<long long>(v);
    if (holds<short>(v)) return std::any_cast<short>(v);
    if (holds<unsigned>(v)) return std::any_cast<unsigned>(v);
    if (holds<unsigned short>(v)) return std::any_cast<unsigned short>(v);
    if (holds<unsigned long>(v)) return static_cast<int64_t>(std::any_cast<unsigned long>(v));
    if (holds<unsigned long long>(v)) return static_cast<int64_t>(std::any_cast<unsigned long long>(v));
    return std::nullopt;
}

bool is_string(const Value& v) {
    return holds<std::string>(v) || holds<std::string_view>(v) || holds<const char*>(v);
}

std::optional<std::string> as_string(const Value& v) {
    if (holds<std::string>(v)) return std::any_cast<const std::string&>(v);
    if (holds<std::string_view>(v)) return std::string(std::any_cast<std::string_view>(v));
    if (holds<const char*>(v)) {
        const char* s = std::any_cast<const char*>(v);
        return s ? std::string(s) : std::string();
    }
    return std::nullopt;
}

std::string value_to_string(const Value& v) {
    if (!v.has_value()) {
        return "null";
    }
    if (auto i = as_integer(v)) {
        return std::to_string(*i);
    }
    if (auto s = as_string(v)) {
        return "'" + *s + "'";
    }
    if (holds<bool>(v)) {
        return std::any_cast<bool>(v) ? "true" : "false";
    }
    if (holds<double>(v) || holds<float>(v)) {
        std::ostringstream oss;
        oss << (holds<double>(v) ? std::any_cast<double>(v) : std::any_cast<float>(v));
        return oss.str();
    }
    if (holds<List>(v)) {
        const auto& list = std::any_cast<const List&>(v);
        std::string out = "[";
        for (size_t i = 0; i < list.size(); ++i) {
            if (i > 0) out += ", ";
            out += value_to_string(list[i]);
        }
        return out + "]";
    }
    if (holds<Dict>(v)) {
        const auto& dict = std::any_cast<const Dict&>(v);
        std::string out = "{";
        bool first = true;
        for (const auto& [k, item] : dict) {
            if (!first) out += ", ";
            first = false;
            out += k + ": " + value_to_string(item);
        }
        return out + "}";
    }
    return std::string("<") + v.type().name() + ">";
}

Dict zip_fields(const FieldShape& shape, const List& values) {
    Dict fields;
    for (size_t i = 0; i < shape.size() && i < values.size(); ++i) {
        fields[shape[i]] = values[i];
    }
    return fields;
}

Value parse_scalar(const std::string& text) {
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    int64_t i = 0;
    auto [iend, iec] = std::from_chars(text.data(), text.data() + text.size(), i);
    if (iec == std::errc() && iend == text.data() + text.size() && !text.empty()) {
        return i;
    }

    double d = 0.0;
    auto [dend, dec] = std::from_chars(text.data(), text.data() + text.size(), d);
    if (dec == std::errc() && dend == text.data() + text.size() && !text.empty()) {
        return d;
    }

    return text;
}

} // namespace tradewire
