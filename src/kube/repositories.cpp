#include "kube/repositories.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <optional>

using d8::logging::LogRegistry;

namespace d8::kube {

namespace {

// Empty when ready, otherwise what is still missing.
std::optional<std::string> notReadyReason(const TransferStatus& status, const bool publish) {
    if (!status.conditionTrue("Ready")) {
        if (const auto c = status.condition("Ready"); c && !c->reason.empty())
            return fmt::format("is not ready ({})", c->reason);
        return "is not ready";
    }
    if (publish && status.publicURL.empty()) return "has no public URL";
    if (!publish && status.url.empty()) return "has no URL";
    return std::nullopt;
}

template <class Resource, class Repo>
Resource pollReady(Repo& repo, const ReadyPolicy& policy, const concurrency::Context& ctx,
                   const std::string& kind, const std::string& name, const std::string& ns, const bool publish) {
    std::string lastReason = "is not ready";

    for (unsigned int attempt = 1; attempt <= policy.attempts; ++attempt) {
        ctx.check();
        auto obj = repo.get(ctx, name, ns);

        if (obj.status.conditionTrue("Expired")) {
            LogRegistry::kube()->info("[{}] {}/{} expired, recreating", kind, ns, name);
            repo.remove(ctx, name, ns);
            obj.name = name;
            obj.namespace_ = ns;
            obj.status = {};
            repo.create(ctx, obj);
        } else if (const auto reason = notReadyReason(obj.status, publish); !reason) {
            LogRegistry::kube()->info("[{}] {}/{} is ready", kind, ns, name);
            return obj;
        } else {
            lastReason = *reason;
            LogRegistry::kube()->info("[{}] {}/{} {}, retrying ({}/{})", kind, ns, name, lastReason, attempt,
                                      policy.attempts);
        }

        if (attempt < policy.attempts) ctx.sleepFor(policy.interval);
    }

    throw std::runtime_error(fmt::format("{} {}/{} {} after {} attempts", kind, ns, name, lastReason, policy.attempts));
}

std::string objectPath(const std::string& collection, const std::string& name) {
    return collection + "/" + name;
}

}

ReadyPolicy ReadyPolicy::fromConfig() {
    const auto& kube = config::ConfigRegistry::get().kube;
    return {kube.ready_attempts == 0 ? 1u : kube.ready_attempts, kube.ready_interval};
}

DataExportRepository::DataExportRepository(KubeApi& api, const ReadyPolicy policy) : api_(api), policy_(policy) {}

void DataExportRepository::create(const concurrency::Context& ctx, const DataExport& exp) {
    try {
        api_.create(ctx, dataExportsPath(exp.namespace_), nlohmann::json(exp));
        LogRegistry::kube()->info("[DataExport] Created {}/{}", exp.namespace_, exp.name);
    } catch (const KubeError& e) {
        if (!e.alreadyExists()) throw;
        LogRegistry::kube()->info("[DataExport] {}/{} already exists", exp.namespace_, exp.name);
    }
}

DataExport DataExportRepository::get(const concurrency::Context& ctx, const std::string& name, const std::string& ns) {
    return api_.get(ctx, objectPath(dataExportsPath(ns), name)).get<DataExport>();
}

void DataExportRepository::remove(const concurrency::Context& ctx, const std::string& name, const std::string& ns) {
    api_.remove(ctx, objectPath(dataExportsPath(ns), name));
    LogRegistry::kube()->info("[DataExport] Deleted {}/{}", ns, name);
}

DataExport DataExportRepository::waitReady(const concurrency::Context& ctx, const std::string& name,
                                           const std::string& ns, const bool publish) {
    return pollReady<DataExport>(*this, policy_, ctx, "DataExport", name, ns, publish);
}

DataImportRepository::DataImportRepository(KubeApi& api, const ReadyPolicy policy) : api_(api), policy_(policy) {}

void DataImportRepository::create(const concurrency::Context& ctx, const DataImport& imp) {
    try {
        api_.create(ctx, dataImportsPath(imp.namespace_), nlohmann::json(imp));
        LogRegistry::kube()->info("[DataImport] Created {}/{}", imp.namespace_, imp.name);
    } catch (const KubeError& e) {
        if (!e.alreadyExists()) throw;
        LogRegistry::kube()->info("[DataImport] {}/{} already exists", imp.namespace_, imp.name);
    }
}

DataImport DataImportRepository::get(const concurrency::Context& ctx, const std::string& name, const std::string& ns) {
    return api_.get(ctx, objectPath(dataImportsPath(ns), name)).get<DataImport>();
}

void DataImportRepository::remove(const concurrency::Context& ctx, const std::string& name, const std::string& ns) {
    api_.remove(ctx, objectPath(dataImportsPath(ns), name));
    LogRegistry::kube()->info("[DataImport] Deleted {}/{}", ns, name);
}

DataImport DataImportRepository::waitReady(const concurrency::Context& ctx, const std::string& name,
                                           const std::string& ns, const bool publish) {
    return pollReady<DataImport>(*this, policy_, ctx, "DataImport", name, ns, publish);
}

}
