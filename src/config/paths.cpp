#include "config/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace d8::paths {

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

fs::path getConfigPath(const std::optional<fs::path>& override) {
    if (override && !override->empty()) return *override;
    if (const char* env = std::getenv("D8_DATA_CONFIG"); env && *env) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "d8" / "data.yaml";
    const auto home = homeDir();
    if (home.empty()) return {};
    return home / ".config" / "d8" / "data.yaml";
}

fs::path getKubeconfigPath(const std::optional<fs::path>& override) {
    if (override && !override->empty()) return *override;
    if (const char* env = std::getenv("KUBECONFIG"); env && *env) {
        std::string list(env);
        // only the first entry of a colon-separated list is honoured
        if (const auto colon = list.find(':'); colon != std::string::npos) list.resize(colon);
        if (!list.empty()) return list;
    }
    const auto home = homeDir();
    if (home.empty()) return {};
    return home / ".kube" / "config";
}

}
