#pragma once

#include "kube/repositories.hpp"
#include "transfer/types.hpp"

namespace d8::kube {

enum class ResourceKind { DataExport, DataImport };

class KubeEndpointProvider : public transfer::TransferEndpointProvider {
public:
    KubeEndpointProvider(ResourceKind kind, KubeApi& api, const http::HttpClient& baseClient,
                         ReadyPolicy policy = ReadyPolicy::fromConfig());

    // Waits for the resource, then picks the URL, trust and volume mode from its status.
    transfer::TransferSession prepare(const concurrency::Context& ctx, const std::string& name,
                                      const std::string& namespace_, bool publish) override;

    static transfer::TransferSession sessionFrom(const TransferStatus& status, const std::string& name,
                                                 const std::string& namespace_, bool publish,
                                                 const http::HttpClient& baseClient);

private:
    ResourceKind kind_;
    KubeApi& api_;
    const http::HttpClient& baseClient_;
    ReadyPolicy policy_;
};

}
