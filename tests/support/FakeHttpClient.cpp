#include "FakeHttpClient.hpp"
#include "concurrency/Context.hpp"
#include "transfer/errors.hpp"

#include <algorithm>
#include <optional>
#include <thread>

namespace d8::test {

FakeHttpClient::FakeHttpClient() : state_(std::make_shared<State>()) {}

void FakeHttpClient::on(const std::string& method, const std::string& url, ScriptedResponse resp) {
    std::lock_guard lock(state_->mutex);
    state_->routes[{method, url}] = std::move(resp);
}

void FakeHttpClient::onAny(Handler handler) {
    std::lock_guard lock(state_->mutex);
    state_->fallback = std::move(handler);
}

void FakeHttpClient::setDelay(const std::chrono::milliseconds delay) {
    std::lock_guard lock(state_->mutex);
    state_->delay = delay;
}

void FakeHttpClient::setChunkSize(const std::size_t n) {
    std::lock_guard lock(state_->mutex);
    state_->chunkSize = std::max<std::size_t>(n, 1);
}

std::vector<RecordedRequest> FakeHttpClient::requests() const {
    std::lock_guard lock(state_->mutex);
    return state_->requests;
}

std::size_t FakeHttpClient::count(const std::string& method) const {
    std::lock_guard lock(state_->mutex);
    return static_cast<std::size_t>(std::ranges::count_if(state_->requests, [&](const auto& r) { return r.method == method; }));
}

ScriptedResponse FakeHttpClient::dispatch(const concurrency::Context& ctx, RecordedRequest req) {
    if (ctx.cancelled()) throw transfer::NetworkError("request aborted: context cancelled", ctx.deadlineExceeded());

    const int now = ++state_->inFlight;
    int seen = state_->maxInFlight.load();
    while (now > seen && !state_->maxInFlight.compare_exchange_weak(seen, now)) {}

    std::chrono::milliseconds delay;
    Handler fallback;
    std::optional<ScriptedResponse> routed;
    {
        std::lock_guard lock(state_->mutex);
        state_->requests.push_back(req);
        delay = state_->delay;
        fallback = state_->fallback;
        if (const auto it = state_->routes.find({req.method, req.url}); it != state_->routes.end()) routed = it->second;
    }

    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    try {
        ScriptedResponse resp = routed ? *routed : fallback ? fallback(req) : ScriptedResponse{404, {}, "not found"};
        --state_->inFlight;
        return resp;
    } catch (...) {
        --state_->inFlight;
        throw;
    }
}

http::HttpResponse FakeHttpClient::get(const concurrency::Context& ctx, const std::string& url, http::BodySink& sink) {
    const auto resp = dispatch(ctx, {"GET", url, {}, {}});

    std::size_t chunk;
    {
        std::lock_guard lock(state_->mutex);
        chunk = state_->chunkSize;
    }

    sink.onResponse(resp.status, resp.headers);
    for (std::size_t i = 0; i < resp.body.size(); i += chunk)
        sink.write(std::string_view(resp.body).substr(i, chunk));
    return {resp.status, resp.headers, {}};
}

http::HttpResponse FakeHttpClient::head(const concurrency::Context& ctx, const std::string& url) {
    const auto resp = dispatch(ctx, {"HEAD", url, {}, {}});
    return {resp.status, resp.headers, resp.body};
}

http::HttpResponse FakeHttpClient::put(const concurrency::Context& ctx, const std::string& url,
                                       http::BodySource& body, const http::Headers& headers) {
    std::string data;
    data.reserve(body.size());
    char buf[4096];
    for (std::size_t n; (n = body.read(buf, sizeof(buf))) > 0;) data.append(buf, n);

    const auto resp = dispatch(ctx, {"PUT", url, headers, std::move(data)});
    return {resp.status, resp.headers, resp.body};
}

std::unique_ptr<http::HttpClient> FakeHttpClient::clone() const {
    auto copy = std::make_unique<FakeHttpClient>(*this);
    return copy;
}

}
