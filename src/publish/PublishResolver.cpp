#include "publish/PublishResolver.hpp"
#include "transfer/errors.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

using d8::logging::LogRegistry;
using namespace d8::transfer;

namespace d8::publish {

PublishResolver::PublishResolver() : PublishResolver(config::ConfigRegistry::get().publish.probe_timeout) {}

PublishResolver::PublishResolver(const std::chrono::milliseconds probeTimeout) : probeTimeout_(probeTimeout) {}

bool PublishResolver::resolve(const concurrency::Context& ctx, const PublishDecision& decision, ServiceProbe& probe) const {
    if (decision.explicit_) {
        LogRegistry::publish()->info("[PublishResolver] Using explicit publish mode: publish={}", decision.value);
        return decision.value;
    }

    LogRegistry::publish()->info("[PublishResolver] Auto-detecting publish mode");
    return detect(ctx, probe);
}

bool PublishResolver::detect(const concurrency::Context& ctx, ServiceProbe& probe) const {
    ServiceIdentity first;
    try {
        first = probe.viaApiServer(ctx);
    } catch (const std::exception& e) {
        LogRegistry::publish()->info("[PublishResolver] Cluster service is not readable via the API server: {}", e.what());
        throw AmbiguousPublishError();
    }

    const auto probeCtx = ctx.withTimeout(probeTimeout_);

    ServiceIdentity second;
    try {
        second = probe.viaClusterIP(*probeCtx, first);
    } catch (const NetworkError& e) {
        if (e.unreachable()) {
            LogRegistry::publish()->info("[PublishResolver] Internal endpoint is unreachable ({}), selecting publish=true", e.what());
            return true;
        }
        LogRegistry::publish()->info("[PublishResolver] Internal probe failed: {}", e.what());
        throw AmbiguousPublishError();
    } catch (const CancelledError& e) {
        if (e.deadlineExceeded() && !ctx.cancelled()) {
            LogRegistry::publish()->info("[PublishResolver] Internal probe timed out, selecting publish=true");
            return true;
        }
        LogRegistry::publish()->info("[PublishResolver] Internal probe cancelled");
        throw AmbiguousPublishError();
    } catch (const std::exception& e) {
        // TLS, auth, RBAC and API errors all leave reachability undecided
        LogRegistry::publish()->info("[PublishResolver] Internal probe rejected: {}", e.what());
        throw AmbiguousPublishError();
    }

    if (first.uid != second.uid) {
        LogRegistry::publish()->info("[PublishResolver] UID mismatch between external ({}) and internal ({}) endpoints, "
                                     "selecting publish=true", first.uid, second.uid);
        return true;
    }

    LogRegistry::publish()->info("[PublishResolver] Internal endpoint is reachable, selecting publish=false");
    return false;
}

}
