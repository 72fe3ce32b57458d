#include "kube/KubeConfig.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/base64.hpp"

#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace stdfs = std::filesystem;

namespace d8::kube {

namespace {

std::string readFile(const stdfs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(fmt::format("kubeconfig: cannot read {}", path.string()));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

YAML::Node findNamed(const YAML::Node& list, const std::string& name, const char* section) {
    if (list && list.IsSequence())
        for (const auto& entry : list)
            if (entry["name"].as<std::string>("") == name) return entry;
    throw std::runtime_error(fmt::format("kubeconfig: {} '{}' not found", section, name));
}

// Prefers the inline *-data field, then the file variant relative to the kubeconfig.
std::string dataOrFile(const YAML::Node& node, const char* dataKey, const char* fileKey, const stdfs::path& baseDir) {
    if (const auto data = node[dataKey].as<std::string>(""); !data.empty()) return util::b64Decode(data);
    if (const auto file = node[fileKey].as<std::string>(""); !file.empty()) {
        const stdfs::path p(file);
        return readFile(p.is_absolute() ? p : baseDir / p);
    }
    return {};
}

}

KubeConfig KubeConfig::load(const stdfs::path& path, const std::string& context) {
    if (path.empty()) throw std::runtime_error("kubeconfig: no path configured and $HOME is not set");
    return parse(readFile(path), path.parent_path(), context);
}

KubeConfig KubeConfig::parse(const std::string& yaml, const stdfs::path& baseDir, const std::string& context) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("kubeconfig: {}", e.what()));
    }

    KubeConfig kc;
    kc.contextName = context.empty() ? root["current-context"].as<std::string>("") : context;
    if (kc.contextName.empty()) throw std::runtime_error("kubeconfig: no current-context set, pass --context");

    const auto ctx = findNamed(root["contexts"], kc.contextName, "context")["context"];
    const auto clusterName = ctx["cluster"].as<std::string>("");
    const auto userName = ctx["user"].as<std::string>("");
    kc.namespace_ = ctx["namespace"].as<std::string>("");

    const auto cluster = findNamed(root["clusters"], clusterName, "cluster")["cluster"];
    kc.server = cluster["server"].as<std::string>("");
    if (kc.server.empty()) throw std::runtime_error(fmt::format("kubeconfig: cluster '{}' has no server", clusterName));
    kc.caPem = dataOrFile(cluster, "certificate-authority-data", "certificate-authority", baseDir);
    kc.insecureSkipVerify = cluster["insecure-skip-tls-verify"].as<bool>(false);

    if (!userName.empty()) {
        const auto user = findNamed(root["users"], userName, "user")["user"];
        kc.token = user["token"].as<std::string>("");
        if (kc.token.empty()) {
            if (const auto tokenFile = user["tokenFile"].as<std::string>(""); !tokenFile.empty()) {
                const stdfs::path p(tokenFile);
                kc.token = readFile(p.is_absolute() ? p : baseDir / p);
                while (!kc.token.empty() && (kc.token.back() == '\n' || kc.token.back() == '\r')) kc.token.pop_back();
            }
        }
        kc.clientCertPem = dataOrFile(user, "client-certificate-data", "client-certificate", baseDir);
        kc.clientKeyPem = dataOrFile(user, "client-key-data", "client-key", baseDir);
    }

    return kc;
}

http::TlsOptions KubeConfig::tlsOptions() const {
    http::TlsOptions opts;
    opts.caPem = caPem;
    opts.clientCertPem = clientCertPem;
    opts.clientKeyPem = clientKeyPem;
    opts.bearerToken = token;
    opts.insecureSkipVerify = insecureSkipVerify;
    opts.connectTimeout = config::ConfigRegistry::get().transfer.connect_timeout;
    return opts;
}

}
