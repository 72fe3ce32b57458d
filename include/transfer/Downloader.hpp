#pragma once

#include "concurrency/Context.hpp"
#include "concurrency/Semaphore.hpp"
#include "fs/FileSystem.hpp"
#include "http/HttpClient.hpp"
#include "transfer/ListingDecoder.hpp"
#include "transfer/types.hpp"

#include <exception>
#include <filesystem>
#include <mutex>
#include <string>

namespace d8::transfer {

struct DownloadStats {
    unsigned int files = 0;
};

struct DownloadOutcome {
    unsigned int files = 0;
    std::exception_ptr error;
    std::string message;
};

// Shared by the sibling tasks of one directory level.
struct DownloadAccumulator {
    void record(DownloadOutcome&& outcome);
    DownloadOutcome take();

private:
    std::mutex mutex_;
    DownloadOutcome total_;
};

class Downloader {
public:
    Downloader(http::HttpClient& client, fs::FileSystem& fs);
    Downloader(http::HttpClient& client, fs::FileSystem& fs, std::size_t concurrency, std::size_t errorBodyLimit);

    // Throws PartialDownloadError carrying the number of files written before the first failure.
    DownloadStats download(const concurrency::Context& ctx,
                           const std::string& baseURL,
                           const std::string& remoteSrcPath,
                           const std::filesystem::path& localDstPath,
                           VolumeMode mode);

private:
    struct Walk {
        const concurrency::Context& ctx;
        concurrency::Semaphore& sem;
        std::string filesURL;
    };

    // Entered with one semaphore slot already acquired on its behalf.
    DownloadOutcome runTask(const Walk& walk, const std::string& srcPath, const std::filesystem::path& dst);

    void fetchFile(const concurrency::Context& ctx, const std::string& url, const std::filesystem::path& dst);
    // Streams the listing at url and runs one task per entry as it is decoded. Releases
    // slot once the listing headers arrive.
    DownloadOutcome streamDirectory(const Walk& walk, const std::string& srcPath, const std::filesystem::path& dst,
                                    const std::string& url, concurrency::Semaphore::Guard& slot);

    void downloadBlock(const concurrency::Context& ctx, const std::string& baseURL,
                       const std::filesystem::path& dst);

    http::HttpClient& client_;
    fs::FileSystem& fs_;
    std::size_t concurrency_;
    std::size_t errorBodyLimit_;
};

}
