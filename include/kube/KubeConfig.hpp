#pragma once

#include "http/CurlHttpClient.hpp"

#include <filesystem>
#include <string>

namespace d8::kube {

// The parts of a kubeconfig the CLI needs to reach one API server.
struct KubeConfig {
    std::string contextName;
    std::string namespace_; // context default namespace, may be empty
    std::string server;
    std::string caPem;
    bool insecureSkipVerify = false;
    std::string token;
    std::string clientCertPem;
    std::string clientKeyPem;

    // Empty context selects current-context.
    static KubeConfig load(const std::filesystem::path& path, const std::string& context = "");
    static KubeConfig parse(const std::string& yaml, const std::filesystem::path& baseDir,
                            const std::string& context = "");

    [[nodiscard]] http::TlsOptions tlsOptions() const;
};

}
