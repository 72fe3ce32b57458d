#include <gtest/gtest.h>
#include "transfer/Downloader.hpp"
#include "transfer/errors.hpp"
#include "concurrency/Context.hpp"
#include "fs/FileSystem.hpp"

#include "../support/FakeHttpClient.hpp"
#include "../support/TempDir.hpp"

#include <atomic>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <thread>

using namespace d8;
using namespace d8::transfer;
using d8::test::FakeHttpClient;
using d8::test::ScriptedResponse;
using d8::test::TempDir;
using json = nlohmann::json;

namespace {

constexpr auto kBase = "http://exporter.local";
constexpr auto kFiles = "http://exporter.local/api/v1/files";

std::string listing(const std::vector<std::pair<std::string, std::string>>& items) {
    json body{{"apiVersion", "v1"}, {"items", json::array()}};
    for (const auto& [name, type] : items) body["items"].push_back({{"name", name}, {"type", type}});
    return body.dump();
}

// Serves the listing of /live/ in two writes and waits in between for the first child request.
class SplitListingClient : public FakeHttpClient {
public:
    http::HttpResponse get(const concurrency::Context& ctx, const std::string& url, http::BodySink& sink) override {
        if (url != fmt::format("{}/live/", kFiles)) return FakeHttpClient::get(ctx, url, sink);

        sink.onResponse(200, {});
        sink.write(R"({"items":[{"name":"a","type":"file"},)");

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (count("GET") == 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        childStartedMidListing = count("GET") > 0;

        sink.write(R"({"name":"b","type":"file"}]})");
        return {200, {}, {}};
    }

    std::atomic<bool> childStartedMidListing{false};
};

class DownloaderTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    fs::LocalFileSystem fs;
    TempDir tmp;
    concurrency::Context::Ptr ctx = concurrency::Context::background();
};

}

TEST_F(DownloaderTest, MirrorsRemoteTree) {
    http.on("GET", fmt::format("{}/data/", kFiles), {200, {}, listing({{"a.txt", "file"}, {"sub", "dir"}, {"empty", "dir"}})});
    http.on("GET", fmt::format("{}/data/a.txt", kFiles), {200, {}, "alpha contents"});
    http.on("GET", fmt::format("{}/data/sub/", kFiles), {200, {}, listing({{"b.bin", "file"}})});
    http.on("GET", fmt::format("{}/data/sub/b.bin", kFiles), {200, {}, std::string("\0\1\2bin", 6)});
    http.on("GET", fmt::format("{}/data/empty/", kFiles), {200, {}, listing({})});

    Downloader dl(http, fs, 4, 1000);
    const auto stats = dl.download(*ctx, kBase, "/data/", tmp / "out", VolumeMode::Filesystem);

    EXPECT_EQ(stats.files, 2u);
    EXPECT_EQ(TempDir::read(tmp / "out/a.txt"), "alpha contents");
    EXPECT_EQ(TempDir::read(tmp / "out/sub/b.bin"), std::string("\0\1\2bin", 6));
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "out/empty"));
    EXPECT_EQ(http.count("GET"), 5u);
}

TEST_F(DownloaderTest, SingleFileWithoutLeadingSlash) {
    http.on("GET", fmt::format("{}/report.csv", kFiles), {200, {}, "x,y\n1,2\n"});

    Downloader dl(http, fs, 2, 1000);
    const auto stats = dl.download(*ctx, kBase, "report.csv", tmp / "report.csv", VolumeMode::Filesystem);

    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(TempDir::read(tmp / "report.csv"), "x,y\n1,2\n");
}

TEST_F(DownloaderTest, ConcurrencyStaysWithinLimit) {
    std::vector<std::pair<std::string, std::string>> items;
    for (int i = 0; i < 50; ++i) {
        const auto name = fmt::format("f{:02}", i);
        items.emplace_back(name, "file");
        http.on("GET", fmt::format("{}/bulk/{}", kFiles, name), {200, {}, name});
    }
    http.on("GET", fmt::format("{}/bulk/", kFiles), {200, {}, listing(items)});
    http.setDelay(std::chrono::milliseconds(20));

    Downloader dl(http, fs, 10, 1000);
    const auto stats = dl.download(*ctx, kBase, "/bulk/", tmp / "bulk", VolumeMode::Filesystem);

    EXPECT_EQ(stats.files, 50u);
    EXPECT_LE(http.maxInFlight(), 10);
    EXPECT_GT(http.maxInFlight(), 1);
    EXPECT_EQ(TempDir::read(tmp / "bulk/f37"), "f37");
}

TEST_F(DownloaderTest, PartialFailureReportsCompletedFiles) {
    std::vector<std::pair<std::string, std::string>> items;
    for (int i = 0; i < 5; ++i) {
        const auto name = fmt::format("f{}", i);
        items.emplace_back(name, "file");
        if (i < 2) http.on("GET", fmt::format("{}/mix/{}", kFiles, name), {200, {}, "ok"});
        else http.on("GET", fmt::format("{}/mix/{}", kFiles, name), {500, {}, "boom"});
    }
    http.on("GET", fmt::format("{}/mix/", kFiles), {200, {}, listing(items)});

    Downloader dl(http, fs, 1, 1000);
    try {
        dl.download(*ctx, kBase, "/mix/", tmp / "mix", VolumeMode::Filesystem);
        FAIL() << "expected PartialDownloadError";
    } catch (const PartialDownloadError& e) {
        EXPECT_EQ(e.filesDownloaded(), 2u);
        EXPECT_NE(std::string(e.what()).find("download /mix/f"), std::string::npos);
        ASSERT_TRUE(e.cause());
        EXPECT_THROW(std::rethrow_exception(e.cause()), HttpStatusError);
    }
    EXPECT_EQ(http.count("GET"), 6u);
}

TEST_F(DownloaderTest, ErrorBodyIsTruncated) {
    http.on("GET", fmt::format("{}/big.log", kFiles), {403, {}, std::string(5000, 'e')});

    Downloader dl(http, fs, 2, 1000);
    try {
        dl.download(*ctx, kBase, "/big.log", tmp / "big.log", VolumeMode::Filesystem);
        FAIL() << "expected PartialDownloadError";
    } catch (const PartialDownloadError& e) {
        EXPECT_EQ(e.filesDownloaded(), 0u);
        try {
            std::rethrow_exception(e.cause());
        } catch (const HttpStatusError& status) {
            EXPECT_EQ(status.status(), 403);
            EXPECT_EQ(status.body().size(), 1000u);
        }
    }
    EXPECT_FALSE(std::filesystem::exists(tmp / "big.log"));
}

TEST_F(DownloaderTest, MalformedListingFails) {
    http.on("GET", fmt::format("{}/bad/", kFiles), {200, {}, R"({"items":[{"name":"x","type":"socket"}]})"});

    Downloader dl(http, fs, 2, 1000);
    EXPECT_THROW(dl.download(*ctx, kBase, "/bad/", tmp / "bad", VolumeMode::Filesystem), PartialDownloadError);
}

TEST_F(DownloaderTest, EntriesStartWhileListingStreams) {
    SplitListingClient split;
    split.on("GET", fmt::format("{}/live/a", kFiles), {200, {}, "first"});
    split.on("GET", fmt::format("{}/live/b", kFiles), {200, {}, "second"});

    Downloader dl(split, fs, 1, 1000);
    const auto stats = dl.download(*ctx, kBase, "/live/", tmp / "live", VolumeMode::Filesystem);

    EXPECT_EQ(stats.files, 2u);
    EXPECT_TRUE(split.childStartedMidListing);
    EXPECT_EQ(TempDir::read(tmp / "live/a"), "first");
    EXPECT_EQ(TempDir::read(tmp / "live/b"), "second");
}

TEST_F(DownloaderTest, MalformedTailKeepsEarlierEntries) {
    http.on("GET", fmt::format("{}/tail/", kFiles),
            {200, {}, R"({"items":[{"name":"ok.txt","type":"file"},{"name":"x","type":"socket"}]})"});
    http.on("GET", fmt::format("{}/tail/ok.txt", kFiles), {200, {}, "kept"});

    Downloader dl(http, fs, 2, 1000);
    try {
        dl.download(*ctx, kBase, "/tail/", tmp / "tail", VolumeMode::Filesystem);
        FAIL() << "expected PartialDownloadError";
    } catch (const PartialDownloadError& e) {
        EXPECT_EQ(e.filesDownloaded(), 1u);
        EXPECT_THROW(std::rethrow_exception(e.cause()), ProtocolError);
    }
    EXPECT_EQ(TempDir::read(tmp / "tail/ok.txt"), "kept");
}

TEST_F(DownloaderTest, DirectoryToStdoutIsRejected) {
    Downloader dl(http, fs, 2, 1000);
    EXPECT_THROW(dl.download(*ctx, kBase, "/data/", {}, VolumeMode::Filesystem), TransferError);
    EXPECT_TRUE(http.requests().empty());
}

TEST_F(DownloaderTest, BlockModeWritesDiskSize) {
    http.on("HEAD", "http://exporter.local/api/v1/block", {200, {{"Content-Length", "1073741824"}}, {}});

    Downloader dl(http, fs, 2, 1000);
    const auto stats = dl.download(*ctx, kBase, "", tmp / "disk.txt", VolumeMode::Block);

    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(TempDir::read(tmp / "disk.txt"), "Disk size: 1Gi\n");
    EXPECT_EQ(http.count("GET"), 0u);
}

TEST_F(DownloaderTest, BlockModeWithoutLengthFails) {
    http.on("HEAD", "http://exporter.local/api/v1/block", {200, {}, {}});

    Downloader dl(http, fs, 2, 1000);
    EXPECT_THROW(dl.download(*ctx, kBase, "", tmp / "disk.txt", VolumeMode::Block), PartialDownloadError);
}

TEST_F(DownloaderTest, FilesystemModeRequiresSource) {
    Downloader dl(http, fs, 2, 1000);
    EXPECT_THROW(dl.download(*ctx, kBase, "", tmp / "x", VolumeMode::Filesystem), TransferError);
}

TEST_F(DownloaderTest, CancelledContextStopsBeforeAnyRequest) {
    const auto child = ctx->withCancel();
    child->cancel();

    Downloader dl(http, fs, 2, 1000);
    try {
        dl.download(*child, kBase, "/data/", tmp / "out", VolumeMode::Filesystem);
        FAIL() << "expected PartialDownloadError";
    } catch (const PartialDownloadError& e) {
        EXPECT_EQ(e.filesDownloaded(), 0u);
        EXPECT_THROW(std::rethrow_exception(e.cause()), CancelledError);
    }
    EXPECT_TRUE(http.requests().empty());
}
