#pragma once

#include "concurrency/Context.hpp"
#include "kube/KubeClient.hpp"
#include "kube/resources.hpp"

#include <chrono>
#include <string>

namespace d8::kube {

struct ReadyPolicy {
    unsigned int attempts = 60;
    std::chrono::milliseconds interval{3000};

    static ReadyPolicy fromConfig();
};

class DataExportRepository {
public:
    explicit DataExportRepository(KubeApi& api, ReadyPolicy policy = ReadyPolicy::fromConfig());

    // An export that already exists is left as is.
    void create(const concurrency::Context& ctx, const DataExport& exp);
    DataExport get(const concurrency::Context& ctx, const std::string& name, const std::string& ns);
    void remove(const concurrency::Context& ctx, const std::string& name, const std::string& ns);

    // Polls until Ready with a usable URL. An Expired export is deleted and recreated from its own spec.
    DataExport waitReady(const concurrency::Context& ctx, const std::string& name, const std::string& ns, bool publish);

private:
    KubeApi& api_;
    ReadyPolicy policy_;
};

class DataImportRepository {
public:
    explicit DataImportRepository(KubeApi& api, ReadyPolicy policy = ReadyPolicy::fromConfig());

    void create(const concurrency::Context& ctx, const DataImport& imp);
    DataImport get(const concurrency::Context& ctx, const std::string& name, const std::string& ns);
    void remove(const concurrency::Context& ctx, const std::string& name, const std::string& ns);
    DataImport waitReady(const concurrency::Context& ctx, const std::string& name, const std::string& ns, bool publish);

private:
    KubeApi& api_;
    ReadyPolicy policy_;
};

}
