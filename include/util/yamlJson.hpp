#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace d8::util {

// Plain scalars become bool/int/float when they parse as one; quoted scalars stay strings.
nlohmann::json yamlToJson(const YAML::Node& node);

}
