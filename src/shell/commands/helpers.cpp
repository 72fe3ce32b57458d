#include "shell/commands/helpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "kube/KubeServiceProbe.hpp"
#include "logging/LogRegistry.hpp"
#include "publish/PublishResolver.hpp"
#include "transfer/errors.hpp"
#include "util/shellArgsHelpers.hpp"

#include <fmt/core.h>

#include <stdexcept>

using namespace d8::config;
using namespace d8::logging;

namespace d8::shell::commands {

KubeSession openKubeSession() {
    const auto& kcfg = ConfigRegistry::get().kube;
    const auto path = kcfg.kubeconfig.empty() ? paths::getKubeconfigPath() : paths::getKubeconfigPath(kcfg.kubeconfig);

    KubeSession session;
    session.kubeconfig = kube::KubeConfig::load(path, kcfg.context);
    const auto tls = session.kubeconfig.tlsOptions();
    session.client = std::make_unique<kube::KubeClient>(session.kubeconfig.server, tls);
    session.dataClient = std::make_unique<http::CurlHttpClient>(tls);

    LogRegistry::kube()->debug("[KubeSession] Using context '{}' at {}", session.kubeconfig.contextName,
                               session.kubeconfig.server);
    return session;
}

std::string namespaceFor(const CommandCall& call) {
    if (const auto ns = optVal(call, std::vector<std::string>{"namespace", "n"}); ns && !ns->empty()) return *ns;
    return ConfigRegistry::get().defaults.namespace_;
}

std::string ttlFor(const CommandCall& call) {
    if (const auto ttl = optVal(call, "ttl"); ttl && !ttl->empty()) return *ttl;
    return ConfigRegistry::get().defaults.ttl;
}

bool resolvePublish(const CommandCall& call, kube::KubeClient& client, const std::vector<std::string>& keys) {
    const auto parsed = parsePublish(call, keys);
    if (!parsed.ok) throw std::invalid_argument(parsed.error);

    const transfer::PublishDecision decision{parsed.explicit_, parsed.value};
    if (decision.explicit_) return decision.value;

    kube::KubeServiceProbe probe(client);
    return publish::PublishResolver().resolve(*call.ctx, decision, probe);
}

CommandResult runGuarded(const std::string& what, const std::function<CommandResult()>& fn) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        return invalid(fmt::format("{}: {}", what, e.what()));
    } catch (const transfer::CancelledError& e) {
        LogRegistry::d8()->warn("[{}] Interrupted: {}", what, e.what());
        return failed(fmt::format("{}: {}", what, e.what()));
    } catch (const std::exception& e) {
        LogRegistry::d8()->debug("[{}] Failed: {}", what, e.what());
        return failed(fmt::format("{}: {}", what, e.what()));
    }
}

}
