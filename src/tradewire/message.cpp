#include "message.hpp"

namespace tradewire {

Message::Message(std::string type_name, std::shared_ptr<const FieldShape> shape, Dict fields)
    : _type_name(std::move(type_name))
    , _shape(shape ? std::move(shape) : std::make_shared<const FieldShape>())
    , _fields(std::move(fields)) {}

bool Message::has(const std::string& field) const {
    auto it = _fields.find(field);
    return it != _fields.end() && it->second.has_value();
}

Result<Value> Message::get(const std::string& field) const {
    auto it = _fields.find(field);
    if (it == _fields.end()) {
        return Err<Value>("Message::get: '" + _type_name + "' has no field '" + field + "'");
    }
    return Ok(it->second);
}

std::string Message::to_string() const {
    std::string out = "<" + _type_name;
    bool first = true;
    for (const auto& name : *_shape) {
        out += first ? " " : ", ";
        first = false;
        auto it = _fields.find(name);
        out += name + "=" + (it != _fields.end() ? value_to_string(it->second) : "null");
    }
    return out + ">";
}

} // namespace tradewire
