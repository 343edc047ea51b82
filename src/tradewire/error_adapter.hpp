#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>

namespace tradewire {

// Name of the message type every error call shape is normalised to
inline constexpr const char* ERROR_TYPE = "error";

// Call shapes of the "error" event, in resolution priority order
enum class ErrorShape {
    Coded,   // (id: integer, errorCode: integer, errorMsg: string)
    Text,    // (errorMsg: string)
    Opaque,  // anything else, kept as a single value
};

const char* to_string(ErrorShape shape);

struct ResolvedError {
    ErrorShape shape;
    Dict fields;
};

// Picks the first matching shape for a positional argument list.
// A single argument is kept as is; any other unmatched list becomes
// errorMsg itself. Never fails.
ResolvedError resolve_error_args(const List& args);

// Canonical field mappings for each shape
Dict error_fields(const Value& value);
Dict error_fields(const std::string& text);
Dict error_fields(int64_t id, int64_t error_code, const std::string& text);

} // namespace tradewire
