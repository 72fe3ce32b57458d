#pragma once

#include "concurrency/Context.hpp"
#include "http/CurlHttpClient.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace d8::kube {

class KubeError : public std::runtime_error {
public:
    KubeError(const std::string& what, long status, std::string reason)
        : std::runtime_error(what), status_(status), reason_(std::move(reason)) {}

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

    [[nodiscard]] bool alreadyExists() const { return reason_ == "AlreadyExists" || status_ == 409; }
    [[nodiscard]] bool notFound() const { return reason_ == "NotFound" || status_ == 404; }

private:
    long status_;
    std::string reason_;
};

// JSON object access by API path (e.g. /apis/deckhouse.io/v1alpha1/namespaces/ns/dataexports/name).
class KubeApi {
public:
    virtual ~KubeApi() = default;

    virtual nlohmann::json get(const concurrency::Context& ctx, const std::string& path) = 0;
    virtual nlohmann::json create(const concurrency::Context& ctx, const std::string& collectionPath,
                                  const nlohmann::json& object) = 0;
    virtual void remove(const concurrency::Context& ctx, const std::string& path) = 0;
};

class KubeClient : public KubeApi {
public:
    KubeClient(std::string server, http::TlsOptions opts);

    nlohmann::json get(const concurrency::Context& ctx, const std::string& path) override;
    nlohmann::json create(const concurrency::Context& ctx, const std::string& collectionPath,
                          const nlohmann::json& object) override;
    void remove(const concurrency::Context& ctx, const std::string& path) override;

    // Same credentials, different endpoint. resolve entries pin a DNS name to an IP.
    [[nodiscard]] KubeClient withEndpoint(std::string server, std::vector<std::string> resolve,
                                          std::chrono::milliseconds timeout) const;

    [[nodiscard]] const std::string& server() const { return server_; }
    [[nodiscard]] const http::TlsOptions& tlsOptions() const { return http_.options(); }

private:
    nlohmann::json request(const concurrency::Context& ctx, const std::string& method,
                           const std::string& path, const std::string& body);

    std::string server_;
    http::CurlHttpClient http_;
};

}
