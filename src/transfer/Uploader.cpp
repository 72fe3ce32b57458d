#include "transfer/Uploader.hpp"
#include "transfer/errors.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

#include <algorithm>
#include <charconv>
#include <fmt/core.h>

using d8::logging::LogRegistry;

namespace d8::transfer {

namespace {

// Streams [offset, offset + length) of a file without touching any other byte.
class FileRangeSource : public http::BodySource {
public:
    FileRangeSource(fs::RandomAccessFile& file, const uint64_t offset, const uint64_t length)
        : file_(file), offset_(offset), length_(length) {}

    [[nodiscard]] uint64_t size() const override { return length_; }

    std::size_t read(char* buf, const std::size_t n) override {
        const auto want = static_cast<std::size_t>(std::min<uint64_t>(n, length_ - pos_));
        if (want == 0) return 0;
        const auto got = file_.readAt(buf, want, offset_ + pos_);
        if (got == 0) throw TransferError(fmt::format("source file shrank while reading offset {}", offset_ + pos_));
        pos_ += got;
        return got;
    }

private:
    fs::RandomAccessFile& file_;
    uint64_t offset_;
    uint64_t length_;
    uint64_t pos_ = 0;
};

int64_t parseOffset(const std::string& header, const std::string& value, const int64_t current) {
    int64_t parsed = 0;
    const auto* end = value.data() + value.size();
    if (const auto [ptr, ec] = std::from_chars(value.data(), end, parsed); ec != std::errc{} || ptr != end)
        throw ProtocolError(fmt::format("invalid {}: '{}'", header, value), current);
    return parsed;
}

std::string excerpt(const std::string& body, const std::size_t limit) {
    return body.size() <= limit ? body : body.substr(0, limit);
}

}

Uploader::Uploader(http::HttpClient& client, fs::FileSystem& fs)
    : Uploader(client, fs, config::ConfigRegistry::get().transfer.error_body_limit) {}

Uploader::Uploader(http::HttpClient& client, fs::FileSystem& fs, const std::size_t errorBodyLimit)
    : client_(client), fs_(fs), errorBodyLimit_(errorBodyLimit) {}

std::string Uploader::uploadURL(const std::string& baseURL, const std::string& dstPath) {
    return util::joinURL(util::joinURL(baseURL, "api/v1/files"), dstPath);
}

void Uploader::upload(const concurrency::Context& ctx,
                      const std::string& baseURL,
                      const std::string& dstPath,
                      const std::filesystem::path& localFilePath,
                      unsigned int chunkCount,
                      const bool resume) {
    const auto url = uploadURL(baseURL, dstPath);
    const auto info = fs_.stat(localFilePath);
    const auto totalSize = static_cast<int64_t>(info.size);

    int64_t offset = 0;
    if (resume) {
        offset = checkProgress(ctx, url);
        if (offset < 0 || offset > totalSize)
            throw ProtocolError(fmt::format("resume offset {} is outside file of {} bytes", offset, totalSize), offset);
        LogRegistry::transfer()->info("[Uploader] Resuming {} at offset {}", url, offset);
    }

    const auto file = fs_.openForRead(localFilePath);

    chunkCount = std::max(chunkCount, 1u);
    const int64_t chunkSize = (totalSize + chunkCount - 1) / chunkCount;

    const http::Headers fixed{
        {"X-Content-Length", std::to_string(totalSize)},
        {"X-Attribute-Permissions", fmt::format("{:04o}", info.mode)},
        {"X-Attribute-Uid", std::to_string(info.uid)},
        {"X-Attribute-Gid", std::to_string(info.gid)},
    };

    LogRegistry::transfer()->info("[Uploader] Uploading {} ({} bytes, {} chunk(s)) to {}",
                                  localFilePath.string(), totalSize, chunkCount, url);

    while (offset < totalSize) {
        ctx.check();

        const int64_t sendLen = std::min(chunkSize, totalSize - offset);
        auto headers = fixed;
        headers.set("X-Offset", std::to_string(offset));

        FileRangeSource body(*file, static_cast<uint64_t>(offset), static_cast<uint64_t>(sendLen));

        http::HttpResponse resp;
        try {
            resp = client_.put(ctx, url, body, headers);
        } catch (const NetworkError& e) {
            throw NetworkError(fmt::format("upload chunk at offset {}: {}", offset, e.what()), e.unreachable(), e.code());
        }

        if (!resp.ok())
            throw HttpStatusError(fmt::format("upload chunk at offset {}", offset), resp.status,
                                  excerpt(resp.body, errorBodyLimit_));

        if (const auto next = resp.headers.get("X-Next-Offset"); next && !next->empty()) {
            const auto adopted = parseOffset("X-Next-Offset", *next, offset);
            if (adopted < offset)
                throw ProtocolError(fmt::format("server returned X-Next-Offset ({}) smaller than current offset ({})",
                                                adopted, offset), adopted);
            offset = adopted;
        } else {
            offset += sendLen;
        }

        LogRegistry::transfer()->debug("[Uploader] {} / {} bytes", std::min(offset, totalSize), totalSize);
    }

    LogRegistry::transfer()->info("[Uploader] Upload completed: {} -> {}", localFilePath.string(), dstPath);
}

int64_t Uploader::checkProgress(const concurrency::Context& ctx, const std::string& url) {
    const auto resp = client_.head(ctx, url);
    if (resp.status == 404) return 0;
    if (resp.status != 200) throw HttpStatusError(fmt::format("HEAD {}", url), resp.status, excerpt(resp.body, errorBodyLimit_));

    for (const auto* header : {"X-Next-Offset", "X-Current-Offset"})
        if (const auto value = resp.headers.get(header); value && !value->empty())
            return parseOffset(header, *value, 0);

    return 0;
}

}
