#include "kube/KubeEndpointProvider.hpp"
#include "logging/LogRegistry.hpp"
#include "util/base64.hpp"
#include "util/url.hpp"

#include <fmt/core.h>
#include <stdexcept>

using d8::logging::LogRegistry;

namespace d8::kube {

KubeEndpointProvider::KubeEndpointProvider(const ResourceKind kind, KubeApi& api, const http::HttpClient& baseClient,
                                           const ReadyPolicy policy)
    : kind_(kind), api_(api), baseClient_(baseClient), policy_(policy) {}

transfer::TransferSession KubeEndpointProvider::prepare(const concurrency::Context& ctx, const std::string& name,
                                                        const std::string& namespace_, const bool publish) {
    TransferStatus status;
    if (kind_ == ResourceKind::DataExport) status = DataExportRepository(api_, policy_).waitReady(ctx, name, namespace_, publish).status;
    else status = DataImportRepository(api_, policy_).waitReady(ctx, name, namespace_, publish).status;

    return sessionFrom(status, name, namespace_, publish, baseClient_);
}

transfer::TransferSession KubeEndpointProvider::sessionFrom(const TransferStatus& status, const std::string& name,
                                                            const std::string& namespace_, const bool publish,
                                                            const http::HttpClient& baseClient) {
    transfer::TransferSession session;
    session.resourceName = name;
    session.namespace_ = namespace_;
    session.volumeMode = transfer::parseVolumeMode(status.volumeMode);

    if (publish && !status.publicURL.empty())
        session.baseURL = util::hasScheme(status.publicURL) ? status.publicURL : "https://" + status.publicURL;
    else
        session.baseURL = status.url;

    if (session.baseURL.empty()) throw std::runtime_error(fmt::format("{}/{} has no URL", namespace_, name));

    session.httpClient = baseClient.clone();
    if (!publish && !status.ca.empty()) {
        try {
            session.httpClient->setCA(util::b64Decode(status.ca));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(fmt::format("decode CA of {}/{}: {}", namespace_, name, e.what()));
        }
    }

    LogRegistry::kube()->debug("[KubeEndpointProvider] {}/{} -> {} ({})", namespace_, name, session.baseURL,
                               transfer::to_string(session.volumeMode));
    return session;
}

}
