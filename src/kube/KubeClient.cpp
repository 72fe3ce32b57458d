#include "kube/KubeClient.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

#include <algorithm>
#include <fmt/core.h>

using d8::logging::LogRegistry;

namespace d8::kube {

KubeClient::KubeClient(std::string server, http::TlsOptions opts)
    : server_(std::move(server)), http_(std::move(opts)) {}

nlohmann::json KubeClient::get(const concurrency::Context& ctx, const std::string& path) {
    return request(ctx, "GET", path, {});
}

nlohmann::json KubeClient::create(const concurrency::Context& ctx, const std::string& collectionPath,
                                  const nlohmann::json& object) {
    return request(ctx, "POST", collectionPath, object.dump());
}

void KubeClient::remove(const concurrency::Context& ctx, const std::string& path) {
    request(ctx, "DELETE", path, {});
}

KubeClient KubeClient::withEndpoint(std::string server, std::vector<std::string> resolve,
                                    const std::chrono::milliseconds timeout) const {
    auto opts = http_.options();
    opts.resolve = std::move(resolve);
    opts.timeout = timeout;
    opts.connectTimeout = std::min(opts.connectTimeout, timeout);
    return {std::move(server), std::move(opts)};
}

nlohmann::json KubeClient::request(const concurrency::Context& ctx, const std::string& method,
                                   const std::string& path, const std::string& body) {
    const auto url = util::joinURL(server_, path);
    http::Headers headers{{"Accept", "application/json"}};
    if (!body.empty()) headers.set("Content-Type", "application/json");

    const auto resp = http_.send(ctx, method, url, body, headers);

    nlohmann::json parsed;
    if (!resp.body.empty()) {
        parsed = nlohmann::json::parse(resp.body, nullptr, false);
        if (parsed.is_discarded() && resp.ok())
            throw std::runtime_error(fmt::format("{} {}: response is not JSON", method, path));
    }

    if (!resp.ok()) {
        std::string reason, message;
        if (parsed.is_object()) {
            reason = parsed.value("reason", "");
            message = parsed.value("message", "");
        }
        if (message.empty()) message = fmt::format("server returned {}", resp.status);
        LogRegistry::kube()->debug("[KubeClient] {} {} -> {} {}", method, path, resp.status, reason);
        throw KubeError(fmt::format("{} {}: {}", method, path, message), resp.status, reason);
    }

    return parsed;
}

}
