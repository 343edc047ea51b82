#pragma once

#include "result.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tradewire {

// Message - immutable record built for one inbound protocol event.
// Holds one value per field of its type's shape; fields the event did
// not carry hold an empty Value.
class Message {
public:
    Message(std::string type_name, std::shared_ptr<const FieldShape> shape, Dict fields);

    const std::string& type_name() const { return _type_name; }
    const FieldShape& shape() const { return *_shape; }
    const Dict& fields() const { return _fields; }

    // True if the field exists in the shape and carries a value
    bool has(const std::string& field) const;

    Result<Value> get(const std::string& field) const;

    template<typename T>
    std::optional<T> get_as(const std::string& field) const {
        auto it = _fields.find(field);
        if (it == _fields.end()) {
            return std::nullopt;
        }
        return tradewire::get_as<T>(it->second);
    }

    // "<tickPrice tickerId=1, field=4, price=101.25, canAutoExecute=0>"
    std::string to_string() const;

private:
    std::string _type_name;
    std::shared_ptr<const FieldShape> _shape;
    Dict _fields;
};

using MessagePtr = std::shared_ptr<const Message>;

} // namespace tradewire
