#pragma once

#include "result.hpp"
#include "types.hpp"
#include "message.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tradewire {

class MessageType;

// Builds a Message of the given type from named field values
using MessageConstructor = std::function<Result<Message>(const MessageType&, const Dict&)>;

// MessageType - identity, field shape and constructor of one message kind
class MessageType {
public:
    MessageType(std::string name, FieldShape fields, MessageConstructor constructor = nullptr);

    const std::string& name() const { return _name; }
    const FieldShape& fields() const { return *_fields; }
    const std::shared_ptr<const FieldShape>& shared_fields() const { return _fields; }

    // Runs the custom constructor if one was given, the default one otherwise
    Result<Message> construct(const Dict& fields) const;

    // Default construction: every shape field is set (null when absent),
    // fields outside the shape are rejected
    static Result<Message> construct_default(const MessageType& type, const Dict& fields);

private:
    std::string _name;
    std::shared_ptr<const FieldShape> _fields;
    MessageConstructor _constructor;
};

using MessageTypePtr = std::shared_ptr<const MessageType>;

// TypeRegistry - immutable catalogue of the message types a receiver knows
class TypeRegistry {
public:
    static Result<std::shared_ptr<const TypeRegistry>> create(std::vector<MessageType> types);

    // Catalogue loading, see builtin() for the document layout
    static Result<std::shared_ptr<const TypeRegistry>> from_yaml(const std::string& yaml_content);
    static Result<std::shared_ptr<const TypeRegistry>> from_file(const std::filesystem::path& path);

    // EWrapper message catalogue compiled into the library
    static Result<std::shared_ptr<const TypeRegistry>> builtin();

    // nullptr when the name is unknown
    MessageTypePtr find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    // All types, in catalogue order
    const std::vector<MessageTypePtr>& types() const { return _types; }
    std::vector<std::string> names() const;
    size_t size() const { return _types.size(); }

private:
    TypeRegistry() = default;

    static Result<std::vector<MessageType>> _parse_catalogue(const YAML::Node& root);

    std::vector<MessageTypePtr> _types;
    std::map<std::string, MessageTypePtr, std::less<>> _by_name;
};

using TypeRegistryPtr = std::shared_ptr<const TypeRegistry>;

} // namespace tradewire
