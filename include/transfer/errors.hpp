#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace d8::transfer {

struct TransferError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class HttpStatusError : public TransferError {
public:
    HttpStatusError(std::string operation, long status, std::string bodyExcerpt);

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& what, std::optional<int64_t> offset = std::nullopt)
        : TransferError(what), offset_(offset) {}

    [[nodiscard]] std::optional<int64_t> offset() const { return offset_; }

private:
    std::optional<int64_t> offset_;
};

class NetworkError : public TransferError {
public:
    NetworkError(const std::string& what, bool unreachable, int code = 0)
        : TransferError(what), unreachable_(unreachable), code_(code) {}

    // Timeout, DNS failure, refused or unroutable connection.
    [[nodiscard]] bool unreachable() const { return unreachable_; }
    [[nodiscard]] int code() const { return code_; }

private:
    bool unreachable_;
    int code_;
};

class CancelledError : public TransferError {
public:
    explicit CancelledError(const bool deadlineExceeded)
        : TransferError(deadlineExceeded ? "context deadline exceeded" : "context cancelled"),
          deadlineExceeded_(deadlineExceeded) {}

    [[nodiscard]] bool deadlineExceeded() const { return deadlineExceeded_; }

private:
    bool deadlineExceeded_;
};

struct AmbiguousPublishError : TransferError {
    AmbiguousPublishError()
        : TransferError("cannot auto-detect publish mode, specify --publish=true or --publish=false") {}
};

class PartialDownloadError : public TransferError {
public:
    PartialDownloadError(const std::string& what, const unsigned int filesDownloaded,
                         std::exception_ptr cause = nullptr)
        : TransferError(what), files_(filesDownloaded), cause_(std::move(cause)) {}

    [[nodiscard]] unsigned int filesDownloaded() const { return files_; }

    // The first error observed anywhere in the tree.
    [[nodiscard]] std::exception_ptr cause() const { return cause_; }

private:
    unsigned int files_;
    std::exception_ptr cause_;
};

}
