#pragma once

#include "types.hpp"
#include <yaml-cpp/yaml.h>

namespace tradewire {

// YAML to Value conversion shared by catalogue and replay-script loading.
// Plain scalars are narrowed with parse_scalar(); quoted scalars stay strings.
Value yaml_to_value(const YAML::Node& node);
Dict yaml_to_dict(const YAML::Node& node);
List yaml_to_list(const YAML::Node& node);

} // namespace tradewire
