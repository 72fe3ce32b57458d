#pragma once

#include "concurrency/Context.hpp"
#include "http/Headers.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace d8::http {

struct HttpResponse {
    long status = 0;
    Headers headers;
    std::string body; // empty for get(), which streams into a BodySink

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
};

// Receives a streamed GET body. onResponse() always runs before the first write().
class BodySink {
public:
    virtual ~BodySink() = default;
    virtual void onResponse(long status, const Headers& headers) = 0;
    virtual void write(std::string_view chunk) = 0;
};

class BodySource {
public:
    virtual ~BodySource() = default;
    [[nodiscard]] virtual uint64_t size() const = 0;
    // Returns bytes copied into buf; 0 means exhausted.
    virtual std::size_t read(char* buf, std::size_t n) = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const concurrency::Context& ctx, const std::string& url, BodySink& sink) = 0;
    virtual HttpResponse head(const concurrency::Context& ctx, const std::string& url) = 0;
    virtual HttpResponse put(const concurrency::Context& ctx, const std::string& url,
                             BodySource& body, const Headers& headers) = 0;

    // Independent copy; setCA() on the copy leaves this client untouched.
    [[nodiscard]] virtual std::unique_ptr<HttpClient> clone() const = 0;
    virtual void setCA(const std::string& pem) = 0;
};

// Collects a bounded prefix of a body, for error diagnostics and small JSON replies.
class StringSink : public BodySink {
public:
    explicit StringSink(const std::size_t limit = SIZE_MAX) : limit_(limit) {}

    void onResponse(const long status, const Headers&) override { status_ = status; }
    void write(std::string_view chunk) override {
        if (body_.size() >= limit_) return;
        body_.append(chunk.substr(0, limit_ - body_.size()));
    }

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& body() const { return body_; }
    std::string take() { return std::move(body_); }

private:
    std::size_t limit_;
    long status_ = 0;
    std::string body_;
};

class StringSource : public BodySource {
public:
    explicit StringSource(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] uint64_t size() const override { return data_.size(); }
    std::size_t read(char* buf, std::size_t n) override;

private:
    std::string data_;
    std::size_t pos_ = 0;
};

}
