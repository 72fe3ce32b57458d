#pragma once

#include "concurrency/Context.hpp"
#include "fs/FileSystem.hpp"
#include "http/HttpClient.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace d8::transfer {

class Uploader {
public:
    Uploader(http::HttpClient& client, fs::FileSystem& fs);
    Uploader(http::HttpClient& client, fs::FileSystem& fs, std::size_t errorBodyLimit);

    // Sends the file as sequential PUTs of ceil(size / chunkCount) bytes. With resume the
    // first chunk starts at the offset the server reports.
    void upload(const concurrency::Context& ctx,
                const std::string& baseURL,
                const std::string& dstPath,
                const std::filesystem::path& localFilePath,
                unsigned int chunkCount,
                bool resume);

    // HEAD on the upload URL: 404 -> 0, 200 -> X-Next-Offset (or legacy X-Current-Offset).
    int64_t checkProgress(const concurrency::Context& ctx, const std::string& url);

    static std::string uploadURL(const std::string& baseURL, const std::string& dstPath);

private:
    http::HttpClient& client_;
    fs::FileSystem& fs_;
    std::size_t errorBodyLimit_;
};

}
