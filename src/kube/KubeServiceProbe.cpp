#include "kube/KubeServiceProbe.hpp"
#include "config/ConfigRegistry.hpp"

#include <fmt/core.h>
#include <stdexcept>

namespace d8::kube {

KubeServiceProbe::KubeServiceProbe(KubeClient client, config::PublishConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {}

KubeServiceProbe::KubeServiceProbe(KubeClient client)
    : KubeServiceProbe(std::move(client), config::ConfigRegistry::get().publish) {}

std::string KubeServiceProbe::servicePath() const {
    return fmt::format("/api/v1/namespaces/{}/services/{}", cfg_.service_namespace, cfg_.service_name);
}

std::string KubeServiceProbe::resolveEntry(const std::string& clusterIP) const {
    if (clusterIP.find(':') != std::string::npos) return fmt::format("{}:443:[{}]", cfg_.server_name, clusterIP);
    return fmt::format("{}:443:{}", cfg_.server_name, clusterIP);
}

publish::ServiceIdentity KubeServiceProbe::identityOf(const nlohmann::json& svc) {
    publish::ServiceIdentity id;
    if (svc.contains("metadata")) id.uid = svc["metadata"].value("uid", "");
    if (svc.contains("spec")) id.clusterIP = svc["spec"].value("clusterIP", "");
    if (id.uid.empty()) throw std::runtime_error("service has no metadata.uid");
    return id;
}

publish::ServiceIdentity KubeServiceProbe::viaApiServer(const concurrency::Context& ctx) {
    auto id = identityOf(client_.get(ctx, servicePath()));
    if (id.clusterIP.empty() || id.clusterIP == "None") throw std::runtime_error("service has no ClusterIP");
    return id;
}

publish::ServiceIdentity KubeServiceProbe::viaClusterIP(const concurrency::Context& ctx,
                                                        const publish::ServiceIdentity& first) {
    auto probe = client_.withEndpoint(fmt::format("https://{}:443", cfg_.server_name),
                                      {resolveEntry(first.clusterIP)}, cfg_.probe_timeout);
    return identityOf(probe.get(ctx, servicePath()));
}

}
