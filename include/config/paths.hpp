#pragma once

#include <filesystem>
#include <optional>

namespace d8::paths {

// --config, then $D8_DATA_CONFIG, then $XDG_CONFIG_HOME/d8/data.yaml, then ~/.config/d8/data.yaml
std::filesystem::path getConfigPath(const std::optional<std::filesystem::path>& override = std::nullopt);

// $KUBECONFIG (first entry), then ~/.kube/config
std::filesystem::path getKubeconfigPath(const std::optional<std::filesystem::path>& override = std::nullopt);

std::filesystem::path homeDir();

}
