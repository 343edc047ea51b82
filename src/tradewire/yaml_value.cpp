#include "yaml_value.hpp"

namespace tradewire {

Value yaml_to_value(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Value{};
    }

    if (node.IsScalar()) {
        // "!" is the non-specific tag yaml-cpp gives quoted scalars
        if (node.Tag() == "!") {
            return Value(node.Scalar());
        }
        return parse_scalar(node.Scalar());
    }

    if (node.IsSequence()) {
        return Value(yaml_to_list(node));
    }

    if (node.IsMap()) {
        return Value(yaml_to_dict(node));
    }

    return Value{};
}

Dict yaml_to_dict(const YAML::Node& node) {
    Dict result;
    if (!node.IsMap()) {
        return result;
    }

    // Complex keys are kept as their dumped YAML text
    for (const auto& kv : node) {
        std::string key = kv.first.IsScalar() ? kv.first.Scalar() : YAML::Dump(kv.first);
        result[key] = yaml_to_value(kv.second);
    }

    return result;
}

List yaml_to_list(const YAML::Node& node) {
    List list;
    if (!node.IsSequence()) {
        return list;
    }

    for (const auto& item : node) {
        list.push_back(yaml_to_value(item));
    }
    return list;
}

} // namespace tradewire
