#include "util/yamlJson.hpp"

#include <charconv>
#include <string>

namespace d8::util {

namespace {

nlohmann::json scalarToJson(const YAML::Node& node) {
    const auto& s = node.Scalar();
    if (node.Tag() != "?") return s; // quoted or explicitly tagged

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "null" || s == "Null" || s == "NULL" || s == "~") return nullptr;

    int64_t i = 0;
    if (const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), i); ec == std::errc() && p == s.data() + s.size())
        return i;

    double d = 0;
    if (const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), d); ec == std::errc() && p == s.data() + s.size())
        return d;

    return s;
}

}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalarToJson(node);
    case YAML::NodeType::Sequence: {
        auto arr = nlohmann::json::array();
        for (const auto& item : node) arr.push_back(yamlToJson(item));
        return arr;
    }
    case YAML::NodeType::Map: {
        auto obj = nlohmann::json::object();
        for (const auto& kv : node) obj[kv.first.as<std::string>()] = yamlToJson(kv.second);
        return obj;
    }
    }
    return nullptr;
}

}
