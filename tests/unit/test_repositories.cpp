#include <gtest/gtest.h>
#include "kube/repositories.hpp"
#include "concurrency/Context.hpp"
#include "transfer/errors.hpp"

#include "../support/FakeKubeApi.hpp"

#include <algorithm>

using namespace d8;
using namespace d8::kube;
using d8::test::FakeKubeApi;
using d8::test::readyStatus;
using namespace std::chrono_literals;

namespace {

const std::string kExport = dataExportsPath("team-a") + "/de-pvc-data";
const std::string kImport = dataImportsPath("team-a") + "/restore";

DataExport sampleExport() {
    DataExport e;
    e.name = "de-pvc-data";
    e.namespace_ = "team-a";
    e.ttl = "5m";
    e.targetKind = "PersistentVolumeClaim";
    e.targetName = "data";
    return e;
}

std::size_t callCount(const FakeKubeApi& api, const std::string& prefix) {
    return static_cast<std::size_t>(std::ranges::count_if(api.calls, [&](const auto& c) { return c.starts_with(prefix); }));
}

class RepositoryTest : public ::testing::Test {
protected:
    FakeKubeApi api;
    ReadyPolicy fast{5, 1ms};
    concurrency::Context::Ptr ctx = concurrency::Context::background();
};

}

TEST_F(RepositoryTest, CreateSerializesTheExport) {
    DataExportRepository repo(api, fast);
    repo.create(*ctx, sampleExport());

    ASSERT_TRUE(api.objects.contains(kExport));
    const auto& obj = api.objects[kExport];
    EXPECT_EQ(obj["kind"], "DataExport");
    EXPECT_EQ(obj["apiVersion"], API_GROUP_VERSION);
    EXPECT_EQ(obj["spec"]["ttl"], "5m");
    EXPECT_EQ(obj["spec"]["targetRef"]["kind"], "PersistentVolumeClaim");
    EXPECT_EQ(obj["spec"]["targetRef"]["name"], "data");
}

TEST_F(RepositoryTest, CreateToleratesAlreadyExists) {
    DataExportRepository repo(api, fast);
    repo.create(*ctx, sampleExport());
    EXPECT_NO_THROW(repo.create(*ctx, sampleExport()));
    EXPECT_EQ(callCount(api, "POST"), 2u);
}

TEST_F(RepositoryTest, GetAndRemoveReportNotFound) {
    DataExportRepository repo(api, fast);
    try {
        repo.get(*ctx, "missing", "team-a");
        FAIL();
    } catch (const KubeError& e) {
        EXPECT_TRUE(e.notFound());
    }
    EXPECT_THROW(repo.remove(*ctx, "missing", "team-a"), KubeError);
}

TEST_F(RepositoryTest, WaitReadyPollsUntilReady) {
    DataExportRepository repo(api, fast);
    repo.create(*ctx, sampleExport());
    api.onGet([](const std::string&, nlohmann::json& obj, const int reads) {
        if (reads == 3) obj["status"] = readyStatus("https://10.0.0.5:8443");
    });

    const auto ready = repo.waitReady(*ctx, "de-pvc-data", "team-a", false);
    EXPECT_EQ(ready.status.url, "https://10.0.0.5:8443");
    EXPECT_EQ(callCount(api, "GET"), 3u);
}

TEST_F(RepositoryTest, PublishWaitsForPublicURL) {
    DataExportRepository repo(api, fast);
    repo.create(*ctx, sampleExport());
    api.onGet([](const std::string&, nlohmann::json& obj, const int reads) {
        obj["status"] = readyStatus("https://10.0.0.5:8443", "Filesystem", reads >= 2 ? "de.example.com/x" : "");
    });

    const auto ready = repo.waitReady(*ctx, "de-pvc-data", "team-a", true);
    EXPECT_EQ(ready.status.publicURL, "de.example.com/x");
    EXPECT_EQ(callCount(api, "GET"), 2u);
}

TEST_F(RepositoryTest, ExhaustionNamesTheLastReason) {
    DataExportRepository repo(api, ReadyPolicy{3, 1ms});
    auto obj = nlohmann::json(sampleExport());
    obj["status"]["conditions"] = nlohmann::json::array({{{"type", "Ready"}, {"status", "False"}, {"reason", "VolumeBinding"}}});
    api.put(kExport, obj);

    try {
        repo.waitReady(*ctx, "de-pvc-data", "team-a", false);
        FAIL();
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "DataExport team-a/de-pvc-data is not ready (VolumeBinding) after 3 attempts");
    }
    EXPECT_EQ(callCount(api, "GET"), 3u);
}

TEST_F(RepositoryTest, ExpiredExportIsRecreatedFromItsSpec) {
    DataExportRepository repo(api, fast);
    auto expired = nlohmann::json(sampleExport());
    expired["status"]["conditions"] = nlohmann::json::array({{{"type", "Expired"}, {"status", "True"}}});
    api.put(kExport, expired);

    api.onGet([](const std::string&, nlohmann::json& obj, int) {
        if (!obj.contains("status")) obj["status"] = readyStatus("https://10.0.0.6:8443");
    });

    const auto ready = repo.waitReady(*ctx, "de-pvc-data", "team-a", false);
    EXPECT_EQ(ready.status.url, "https://10.0.0.6:8443");
    EXPECT_EQ(callCount(api, "DELETE"), 1u);
    EXPECT_EQ(callCount(api, "POST"), 1u);
    EXPECT_EQ(api.objects[kExport]["spec"]["targetRef"]["name"], "data");
    EXPECT_EQ(api.objects[kExport]["spec"]["ttl"], "5m");
}

TEST_F(RepositoryTest, CancellationStopsPolling) {
    DataExportRepository repo(api, ReadyPolicy{100, 1ms});
    repo.create(*ctx, sampleExport());
    const auto child = ctx->withCancel();
    api.onGet([&](const std::string&, nlohmann::json&, const int reads) {
        if (reads == 2) child->cancel();
    });

    EXPECT_THROW(repo.waitReady(*child, "de-pvc-data", "team-a", false), transfer::CancelledError);
    EXPECT_EQ(callCount(api, "GET"), 2u);
}

TEST_F(RepositoryTest, ImportCarriesTemplateAndWffc) {
    DataImportRepository repo(api, fast);
    DataImport imp;
    imp.name = "restore";
    imp.namespace_ = "team-a";
    imp.ttl = "2m";
    imp.waitForFirstConsumer = true;
    imp.pvcTemplate = {{"metadata", {{"name", "restored"}}}, {"spec", {{"storageClassName", "fast"}}}};
    repo.create(*ctx, imp);

    const auto& obj = api.objects[kImport];
    EXPECT_EQ(obj["kind"], "DataImport");
    EXPECT_EQ(obj["spec"]["waitForFirstConsumer"], true);
    EXPECT_FALSE(obj["spec"].contains("publish"));
    EXPECT_EQ(obj["spec"]["targetRef"]["pvcTemplate"]["spec"]["storageClassName"], "fast");

    EXPECT_EQ(repo.get(*ctx, "restore", "team-a").pvcTemplate["metadata"]["name"], "restored");
    repo.remove(*ctx, "restore", "team-a");
    EXPECT_FALSE(api.objects.contains(kImport));
}
