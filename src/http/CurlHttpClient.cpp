#include "http/CurlHttpClient.hpp"
#include "util/curlWrappers.hpp"
#include "transfer/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <exception>
#include <fmt/core.h>

using namespace d8::util;
using d8::logging::LogRegistry;
using d8::transfer::NetworkError;

namespace d8::http {

namespace {

struct TransferState {
    CURL* handle = nullptr;
    const concurrency::Context* ctx = nullptr;
    BodySink* sink = nullptr;
    std::string* buffer = nullptr;
    BodySource* source = nullptr;
    Headers headers;
    long status = 0;
    bool notified = false;
    std::exception_ptr error;

    void notify() {
        if (notified) return;
        notified = true;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        if (sink) sink->onResponse(status, headers);
    }
};

size_t onHeader(char* p, const size_t s, const size_t n, void* ud) {
    auto* st = static_cast<TransferState*>(ud);
    const std::string_view line(p, s * n);
    // interim responses (100 Continue) restart the header block
    if (line.starts_with("HTTP/")) st->headers.clear();
    else st->headers.addRaw(line);
    return s * n;
}

size_t onWrite(char* p, const size_t s, const size_t n, void* ud) {
    auto* st = static_cast<TransferState*>(ud);
    try {
        st->notify();
        if (st->sink) st->sink->write({p, s * n});
        else if (st->buffer) st->buffer->append(p, s * n);
        return s * n;
    } catch (...) {
        // rethrown after curl_easy_perform returns
        st->error = std::current_exception();
        return 0;
    }
}

size_t onRead(char* buf, const size_t s, const size_t n, void* ud) {
    auto* st = static_cast<TransferState*>(ud);
    try {
        return st->source->read(buf, s * n);
    } catch (...) {
        st->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

int onProgress(void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* st = static_cast<TransferState*>(ud);
    return st->ctx->explicitlyCancelled() ? 1 : 0;
}

void applyOptions(CurlEasy& h, const TlsOptions& opts, const concurrency::Context& ctx,
                  TransferState& st, SList& headers, SList& resolve, char* errbuf) {
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &st);

    if (!opts.caPem.empty()) {
        curl_blob ca = blobOf(opts.caPem);
        curl_easy_setopt(h, CURLOPT_CAINFO_BLOB, &ca);
    }
    if (!opts.clientCertPem.empty()) {
        curl_blob cert = blobOf(opts.clientCertPem);
        curl_easy_setopt(h, CURLOPT_SSLCERT_BLOB, &cert);
        curl_easy_setopt(h, CURLOPT_SSLCERTTYPE, "PEM");
    }
    if (!opts.clientKeyPem.empty()) {
        curl_blob key = blobOf(opts.clientKeyPem);
        curl_easy_setopt(h, CURLOPT_SSLKEY_BLOB, &key);
        curl_easy_setopt(h, CURLOPT_SSLKEYTYPE, "PEM");
    }
    if (opts.insecureSkipVerify) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!opts.bearerToken.empty()) headers.add("Authorization: Bearer " + opts.bearerToken);

    for (const auto& entry : opts.resolve) resolve.add(entry);
    if (!resolve.empty()) curl_easy_setopt(h, CURLOPT_RESOLVE, resolve.get());

    if (opts.connectTimeout.count() > 0)
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opts.connectTimeout.count()));

    // The context deadline is enforced by curl itself so it also bounds DNS and the TLS handshake.
    auto total = opts.timeout;
    if (const auto left = ctx.remaining(); left && (total.count() == 0 || *left < total))
        total = std::max(*left, std::chrono::milliseconds{1});
    if (total.count() > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(total.count()));
}

HttpResponse perform(CurlEasy& h, TransferState& st, SList& headers, const char* method,
                     const std::string& url, const char* errbuf) {
    if (!headers.empty()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());

    const CURLcode rc = curl_easy_perform(h);
    if (st.error) std::rethrow_exception(st.error);

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        LogRegistry::http()->debug("[CurlHttpClient] {} {} cancelled", method, url);
        throw NetworkError(fmt::format("{} {}: cancelled", method, url), false, rc);
    }

    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        const bool unreachable = CurlHttpClient::isUnreachable(rc);
        LogRegistry::http()->warn("[CurlHttpClient] {} {} failed: {} (curl code {})", method, url, detail,
                                  static_cast<int>(rc));
        throw NetworkError(fmt::format("{} {}: {}", method, url, detail), unreachable, rc);
    }

    st.notify();

    HttpResponse resp;
    resp.status = st.status;
    resp.headers = std::move(st.headers);
    LogRegistry::http()->debug("[CurlHttpClient] {} {} -> {}", method, url, resp.status);
    return resp;
}

}

CurlHttpClient::CurlHttpClient(TlsOptions opts) : opts_(std::move(opts)) {}

bool CurlHttpClient::isUnreachable(const CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

HttpResponse CurlHttpClient::get(const concurrency::Context& ctx, const std::string& url, BodySink& sink) {
    ctx.check();

    CurlEasy h;
    SList headers, resolve;
    char errbuf[CURL_ERROR_SIZE] = {0};
    TransferState st{.handle = h, .ctx = &ctx, .sink = &sink};

    applyOptions(h, opts_, ctx, st, headers, resolve, errbuf);
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    return perform(h, st, headers, "GET", url, errbuf);
}

HttpResponse CurlHttpClient::head(const concurrency::Context& ctx, const std::string& url) {
    ctx.check();

    CurlEasy h;
    SList headers, resolve;
    char errbuf[CURL_ERROR_SIZE] = {0};
    TransferState st{.handle = h, .ctx = &ctx};

    applyOptions(h, opts_, ctx, st, headers, resolve, errbuf);
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    return perform(h, st, headers, "HEAD", url, errbuf);
}

HttpResponse CurlHttpClient::put(const concurrency::Context& ctx, const std::string& url,
                                 BodySource& body, const Headers& extra) {
    ctx.check();

    CurlEasy h;
    SList headers, resolve;
    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string respBody;
    TransferState st{.handle = h, .ctx = &ctx, .buffer = &respBody, .source = &body};

    applyOptions(h, opts_, ctx, st, headers, resolve, errbuf);
    for (const auto& [name, value] : extra) headers.add(name + ": " + value);
    headers.add("Expect:");

    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, onRead);
    curl_easy_setopt(h, CURLOPT_READDATA, &st);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));

    auto resp = perform(h, st, headers, "PUT", url, errbuf);
    resp.body = std::move(respBody);
    return resp;
}

HttpResponse CurlHttpClient::send(const concurrency::Context& ctx, const std::string& method, const std::string& url,
                                  const std::string& body, const Headers& extra) {
    ctx.check();

    CurlEasy h;
    SList headers, resolve;
    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string respBody;
    TransferState st{.handle = h, .ctx = &ctx, .buffer = &respBody};

    applyOptions(h, opts_, ctx, st, headers, resolve, errbuf);
    for (const auto& [name, value] : extra) headers.add(name + ": " + value);

    if (method == "GET") curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    else curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());

    if (!body.empty()) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    auto resp = perform(h, st, headers, method.c_str(), url, errbuf);
    resp.body = std::move(respBody);
    return resp;
}

void CurlHttpClient::setCA(const std::string& pem) {
    if (opts_.caPem.empty()) opts_.caPem = pem;
    else opts_.caPem += "\n" + pem;
}

std::unique_ptr<HttpClient> CurlHttpClient::clone() const {
    return std::make_unique<CurlHttpClient>(opts_);
}

}
