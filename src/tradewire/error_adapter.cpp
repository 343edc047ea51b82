#include "error_adapter.hpp"

namespace tradewire {

const char* to_string(ErrorShape shape) {
    switch (shape) {
        case ErrorShape::Coded: return "coded";
        case ErrorShape::Text: return "text";
        case ErrorShape::Opaque: return "opaque";
    }
    return "unknown";
}

ResolvedError resolve_error_args(const List& args) {
    if (args.size() == 3 && is_integer(args[0]) && is_integer(args[1]) && is_string(args[2])) {
        Dict fields;
        fields["id"] = args[0];
        fields["errorCode"] = args[1];
        fields["errorMsg"] = *as_string(args[2]);
        return {ErrorShape::Coded, std::move(fields)};
    }

    if (args.size() == 1 && is_string(args[0])) {
        return {ErrorShape::Text, error_fields(*as_string(args[0]))};
    }

    if (args.size() == 1) {
        return {ErrorShape::Opaque, error_fields(args[0])};
    }

    return {ErrorShape::Opaque, error_fields(Value(args))};
}

Dict error_fields(const Value& value) {
    // string_view and const char* payloads are copied so the message owns its text
    if (auto text = as_string(value)) {
        return Dict{{"errorMsg", std::move(*text)}};
    }
    return Dict{{"errorMsg", value}};
}

Dict error_fields(const std::string& text) {
    return Dict{{"errorMsg", text}};
}

Dict error_fields(int64_t id, int64_t error_code, const std::string& text) {
    return Dict{{"id", id}, {"errorCode", error_code}, {"errorMsg", text}};
}

} // namespace tradewire
