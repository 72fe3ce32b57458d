#pragma once

#include "config/Config.hpp"
#include "kube/KubeClient.hpp"
#include "publish/ServiceProbe.hpp"

namespace d8::kube {

// Reads Service default/kubernetes through the kubeconfig endpoint, then again at
// https://kubernetes.default.svc:443 pinned to the service's ClusterIP.
class KubeServiceProbe : public publish::ServiceProbe {
public:
    KubeServiceProbe(KubeClient client, config::PublishConfig cfg);
    explicit KubeServiceProbe(KubeClient client);

    publish::ServiceIdentity viaApiServer(const concurrency::Context& ctx) override;
    publish::ServiceIdentity viaClusterIP(const concurrency::Context& ctx, const publish::ServiceIdentity& first) override;

    [[nodiscard]] std::string servicePath() const;
    [[nodiscard]] std::string resolveEntry(const std::string& clusterIP) const;

private:
    static publish::ServiceIdentity identityOf(const nlohmann::json& svc);

    KubeClient client_;
    config::PublishConfig cfg_;
};

}
