#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fmt/core.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace d8::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config file {}: {}", path.string(), e.what()));
    }

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["publish"]) YAML::convert<PublishConfig>::decode(node, cfg.publish);
    if (auto node = root["kube"]) YAML::convert<KubernetesConfig>::decode(node, cfg.kube);
    if (auto node = root["defaults"]) YAML::convert<DefaultsConfig>::decode(node, cfg.defaults);

    return cfg;
}

} // namespace d8::config
