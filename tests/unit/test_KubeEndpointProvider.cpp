#include <gtest/gtest.h>
#include "kube/KubeEndpointProvider.hpp"
#include "concurrency/Context.hpp"
#include "util/base64.hpp"

#include "../support/FakeHttpClient.hpp"
#include "../support/FakeKubeApi.hpp"

using namespace d8;
using namespace d8::kube;
using d8::test::FakeHttpClient;
using d8::test::FakeKubeApi;
using d8::test::readyStatus;
using namespace std::chrono_literals;

namespace {

const std::string kPem = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";

TransferStatus statusOf(const nlohmann::json& j) { return j.get<TransferStatus>(); }

const FakeHttpClient& fakeOf(const transfer::TransferSession& s) {
    return dynamic_cast<const FakeHttpClient&>(*s.httpClient);
}

}

TEST(KubeEndpointProviderTest, InternalURLTrustsTheExporterCA) {
    FakeHttpClient base;
    const auto status = statusOf(readyStatus("https://10.0.0.5:8443", "Filesystem", "", util::b64Encode(kPem)));

    const auto session = KubeEndpointProvider::sessionFrom(status, "de-pvc-data", "team-a", false, base);
    EXPECT_EQ(session.baseURL, "https://10.0.0.5:8443");
    EXPECT_EQ(session.volumeMode, transfer::VolumeMode::Filesystem);
    EXPECT_EQ(session.resourceName, "de-pvc-data");
    EXPECT_EQ(session.namespace_, "team-a");
    EXPECT_EQ(fakeOf(session).ca(), kPem);
    EXPECT_TRUE(base.ca().empty());
}

TEST(KubeEndpointProviderTest, PublicURLGetsSchemeAndNoCA) {
    FakeHttpClient base;
    const auto status = statusOf(readyStatus("https://10.0.0.5:8443", "Block", "de.example.com/ns/x", util::b64Encode(kPem)));

    const auto session = KubeEndpointProvider::sessionFrom(status, "x", "ns", true, base);
    EXPECT_EQ(session.baseURL, "https://de.example.com/ns/x");
    EXPECT_EQ(session.volumeMode, transfer::VolumeMode::Block);
    EXPECT_TRUE(fakeOf(session).ca().empty());
}

TEST(KubeEndpointProviderTest, PublicURLWithSchemeIsKept) {
    FakeHttpClient base;
    const auto status = statusOf(readyStatus("", "Filesystem", "http://de.example.com/x"));
    EXPECT_EQ(KubeEndpointProvider::sessionFrom(status, "x", "ns", true, base).baseURL, "http://de.example.com/x");
}

TEST(KubeEndpointProviderTest, RejectsMissingURLAndBadInput) {
    FakeHttpClient base;
    EXPECT_THROW(KubeEndpointProvider::sessionFrom(statusOf(readyStatus("", "Filesystem")), "x", "ns", false, base),
                 std::runtime_error);
    EXPECT_THROW(KubeEndpointProvider::sessionFrom(statusOf(readyStatus("https://a", "Filesystem", "", "!!!")), "x", "ns",
                                                   false, base),
                 std::runtime_error);
    EXPECT_THROW(KubeEndpointProvider::sessionFrom(statusOf(readyStatus("https://a", "Tape")), "x", "ns", false, base),
                 std::runtime_error);
}

TEST(KubeEndpointProviderTest, PrepareWaitsForTheImport) {
    FakeKubeApi api;
    FakeHttpClient base;
    const auto path = dataImportsPath("team-a") + "/restore";
    api.put(path, {{"metadata", {{"name", "restore"}, {"namespace", "team-a"}}}, {"spec", nlohmann::json::object()}});
    api.onGet([](const std::string&, nlohmann::json& obj, const int reads) {
        if (reads == 2) obj["status"] = readyStatus("https://10.0.0.9:8443");
    });

    KubeEndpointProvider provider(ResourceKind::DataImport, api, base, ReadyPolicy{5, 1ms});
    const auto session = provider.prepare(*concurrency::Context::background(), "restore", "team-a", false);
    EXPECT_EQ(session.baseURL, "https://10.0.0.9:8443");
    EXPECT_EQ(api.calls.size(), 2u);
}
