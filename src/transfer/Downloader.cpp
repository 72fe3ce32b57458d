#include "transfer/Downloader.hpp"
#include "transfer/errors.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/quantity.hpp"
#include "util/url.hpp"

#include <charconv>
#include <fmt/core.h>
#include <system_error>
#include <thread>

using d8::logging::LogRegistry;
using d8::concurrency::Semaphore;
namespace stdfs = std::filesystem;

namespace d8::transfer {

namespace {

std::unique_ptr<fs::FileWriter> openDestination(fs::FileSystem& fs, const stdfs::path& dst) {
    if (dst.empty()) return std::make_unique<fs::StdoutWriter>();
    return fs.createFile(dst);
}

// Writes a 200 body to the destination; any other status is captured for the error message.
class FileSink : public http::BodySink {
public:
    FileSink(fs::FileSystem& fs, stdfs::path dst, const std::size_t errorLimit)
        : fs_(fs), dst_(std::move(dst)), error_(errorLimit) {}

    void onResponse(const long status, const http::Headers& headers) override {
        status_ = status;
        error_.onResponse(status, headers);
        if (status_ == 200) writer_ = openDestination(fs_, dst_);
    }

    void write(const std::string_view chunk) override {
        if (writer_) writer_->write(chunk);
        else error_.write(chunk);
    }

    void finish(const std::string& url) {
        if (status_ != 200) throw HttpStatusError(fmt::format("GET {}", url), status_, error_.take());
        writer_->close();
    }

private:
    fs::FileSystem& fs_;
    stdfs::path dst_;
    long status_ = 0;
    std::unique_ptr<fs::FileWriter> writer_;
    http::StringSink error_;
};

class ListingSink : public http::BodySink {
public:
    ListingSink(ListingDecoder& decoder, Semaphore::Guard& slot, const std::size_t errorLimit)
        : decoder_(decoder), slot_(slot), error_(errorLimit) {}

    void onResponse(const long status, const http::Headers& headers) override {
        status_ = status;
        error_.onResponse(status, headers);
        // a listing holds its slot only until the headers arrive; children take their own
        if (status_ == 200) slot_.release();
    }

    void write(const std::string_view chunk) override {
        if (status_ == 200) decoder_.feed(chunk);
        else error_.write(chunk);
    }

    void finish(const std::string& url) {
        if (status_ != 200) throw HttpStatusError(fmt::format("GET {}", url), status_, error_.take());
        decoder_.finish();
    }

private:
    ListingDecoder& decoder_;
    Semaphore::Guard& slot_;
    long status_ = 0;
    http::StringSink error_;
};

}

void DownloadAccumulator::record(DownloadOutcome&& outcome) {
    std::lock_guard lock(mutex_);
    total_.files += outcome.files;
    if (outcome.error && !total_.error) {
        total_.error = std::move(outcome.error);
        total_.message = std::move(outcome.message);
    }
}

DownloadOutcome DownloadAccumulator::take() {
    std::lock_guard lock(mutex_);
    return std::move(total_);
}

Downloader::Downloader(http::HttpClient& client, fs::FileSystem& fs)
    : Downloader(client, fs,
                 config::ConfigRegistry::get().transfer.download_concurrency,
                 config::ConfigRegistry::get().transfer.error_body_limit) {}

Downloader::Downloader(http::HttpClient& client, fs::FileSystem& fs,
                       const std::size_t concurrency, const std::size_t errorBodyLimit)
    : client_(client), fs_(fs), concurrency_(concurrency == 0 ? 1 : concurrency), errorBodyLimit_(errorBodyLimit) {}

DownloadStats Downloader::download(const concurrency::Context& ctx,
                                   const std::string& baseURL,
                                   const std::string& remoteSrcPath,
                                   const stdfs::path& localDstPath,
                                   const VolumeMode mode) {
    if (mode == VolumeMode::Block) {
        LogRegistry::transfer()->info("[Downloader] Reading block device size from {}", baseURL);
        try {
            downloadBlock(ctx, baseURL, localDstPath);
        } catch (const std::exception& e) {
            LogRegistry::transfer()->error("[Downloader] Block download failed: {}", e.what());
            throw PartialDownloadError(e.what(), 0, std::current_exception());
        }
        return {1};
    }

    if (remoteSrcPath.empty()) throw TransferError("source path is required for Filesystem mode");
    const std::string src = remoteSrcPath.front() == '/' ? remoteSrcPath : "/" + remoteSrcPath;
    if (src.ends_with('/') && localDstPath.empty())
        throw TransferError(fmt::format("cannot write directory {} to stdout; pass a destination directory", src));

    Semaphore sem(concurrency_);
    const Walk walk{ctx, sem, util::joinURL(baseURL, "api/v1/files")};

    LogRegistry::transfer()->info("[Downloader] Starting download of {} to {}",
                                  walk.filesURL + src, localDstPath.empty() ? "stdout" : localDstPath.string());

    sem.acquire();
    auto outcome = runTask(walk, src, localDstPath);

    if (outcome.error) {
        LogRegistry::transfer()->error("[Downloader] Download failed after {} file(s): {}", outcome.files, outcome.message);
        throw PartialDownloadError(outcome.message, outcome.files, outcome.error);
    }

    LogRegistry::transfer()->info("[Downloader] Download completed: {} file(s)", outcome.files);
    return {outcome.files};
}

DownloadOutcome Downloader::runTask(const Walk& walk, const std::string& srcPath, const stdfs::path& dst) {
    Semaphore::Guard slot(walk.sem, std::adopt_lock);
    try {
        walk.ctx.check();
        const auto url = util::joinURL(walk.filesURL, srcPath);

        if (!srcPath.ends_with('/')) {
            fetchFile(walk.ctx, url, dst);
            return {1, nullptr, {}};
        }

        return streamDirectory(walk, srcPath, dst, url, slot);
    } catch (const std::exception& e) {
        return {0, std::current_exception(), fmt::format("download {}: {}", srcPath, e.what())};
    }
}

void Downloader::fetchFile(const concurrency::Context& ctx, const std::string& url, const stdfs::path& dst) {
    FileSink sink(fs_, dst, errorBodyLimit_);
    client_.get(ctx, url, sink);
    sink.finish(url);
    LogRegistry::transfer()->info("[Downloader] Downloaded file {}", dst.empty() ? "to stdout" : dst.string());
}

DownloadOutcome Downloader::streamDirectory(const Walk& walk, const std::string& srcPath, const stdfs::path& dst,
                                            const std::string& url, Semaphore::Guard& slot) {
    fs_.mkdirAll(dst);

    DownloadAccumulator acc;
    std::size_t dispatched = 0;
    {
        std::vector<std::jthread> workers;

        // Each entry is handed to its own task while the rest of the listing is still arriving.
        ListingDecoder decoder([&](ListingEntry&& entry) {
            std::string childSrc = srcPath + entry.name;
            stdfs::path childDst = dst / entry.name;
            if (entry.type == EntryType::Dir) {
                childSrc += '/';
                fs_.mkdirAll(childDst);
            }

            walk.sem.acquire();
            try {
                workers.emplace_back([this, &walk, &acc, childSrc = std::move(childSrc), childDst = std::move(childDst)] {
                    acc.record(runTask(walk, childSrc, childDst));
                });
            } catch (const std::system_error&) {
                walk.sem.release();
                throw;
            }
            ++dispatched;
        });

        try {
            ListingSink sink(decoder, slot, errorBodyLimit_);
            client_.get(walk.ctx, url, sink);
            sink.finish(url);
        } catch (const std::exception& e) {
            acc.record({0, std::current_exception(), fmt::format("download {}: {}", srcPath, e.what())});
        }
    } // joins every worker

    LogRegistry::transfer()->debug("[Downloader] Listed {}: {} entries", url, dispatched);
    return acc.take();
}

void Downloader::downloadBlock(const concurrency::Context& ctx, const std::string& baseURL, const stdfs::path& dst) {
    const auto url = util::joinURL(baseURL, "api/v1/block");
    const auto resp = client_.head(ctx, url);
    if (resp.status != 200) throw HttpStatusError(fmt::format("HEAD {}", url), resp.status, resp.body);

    const auto length = resp.headers.get("Content-Length");
    if (!length) throw ProtocolError(fmt::format("HEAD {}: missing Content-Length", url));

    int64_t size = 0;
    const auto* end = length->data() + length->size();
    if (const auto [ptr, ec] = std::from_chars(length->data(), end, size); ec != std::errc{} || ptr != end || size < 0)
        throw ProtocolError(fmt::format("HEAD {}: invalid Content-Length '{}'", url, *length));

    const auto writer = openDestination(fs_, dst);
    writer->write(fmt::format("Disk size: {}\n", util::formatBinarySI(size)));
    writer->close();
}

}
