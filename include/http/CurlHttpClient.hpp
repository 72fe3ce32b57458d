#pragma once

#include "http/HttpClient.hpp"

#include <chrono>
#include <curl/curl.h>
#include <string>
#include <vector>

namespace d8::http {

struct TlsOptions {
    std::string caPem;
    std::string clientCertPem;
    std::string clientKeyPem;
    std::string bearerToken;
    bool insecureSkipVerify = false;
    // host:port:ip entries; TLS is still verified against host
    std::vector<std::string> resolve;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds timeout{0}; // 0 = bounded only by the context deadline
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(TlsOptions opts = {});

    HttpResponse get(const concurrency::Context& ctx, const std::string& url, BodySink& sink) override;
    HttpResponse head(const concurrency::Context& ctx, const std::string& url) override;
    HttpResponse put(const concurrency::Context& ctx, const std::string& url,
                     BodySource& body, const Headers& headers) override;

    // Buffered request with an arbitrary verb; used for JSON APIs.
    HttpResponse send(const concurrency::Context& ctx, const std::string& method, const std::string& url,
                      const std::string& body, const Headers& headers);

    [[nodiscard]] std::unique_ptr<HttpClient> clone() const override;
    // Adds to the trusted set; any CA already configured stays trusted.
    void setCA(const std::string& pem) override;

    [[nodiscard]] const TlsOptions& options() const { return opts_; }

    static bool isUnreachable(CURLcode code);

private:
    TlsOptions opts_;
};

}
