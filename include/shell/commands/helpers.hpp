#pragma once

#include "shell/types.hpp"
#include "kube/KubeConfig.hpp"
#include "kube/KubeClient.hpp"
#include "http/CurlHttpClient.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace d8::shell::commands {

// Control-plane and data-plane clients built from the active kubeconfig.
struct KubeSession {
    kube::KubeConfig kubeconfig;
    std::unique_ptr<kube::KubeClient> client;
    std::unique_ptr<http::CurlHttpClient> dataClient;
};

KubeSession openKubeSession();

// -n/--namespace, else defaults.namespace from the config.
std::string namespaceFor(const CommandCall& call);

// --ttl, else defaults.ttl from the config.
std::string ttlFor(const CommandCall& call);

// Tri-state --publish; auto-detects through the cluster service when the flag is absent.
bool resolvePublish(const CommandCall& call, kube::KubeClient& client,
                    const std::vector<std::string>& keys = {"publish"});

// Runs fn and turns any exception into exit code 1 with "<what>: <error>".
CommandResult runGuarded(const std::string& what, const std::function<CommandResult()>& fn);

}
