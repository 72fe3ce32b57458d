#include "StubExporterServer.hpp"

#include <nlohmann/json.hpp>

#include <set>

namespace http = boost::beast::http;

namespace d8::test {

namespace {

constexpr std::string_view kFilesPrefix = "/api/v1/files";

}

StubExporterServer::StubExporterServer() : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    doAccept();
    ioThread_ = std::thread([this] { ioc_.run(); });
}

StubExporterServer::~StubExporterServer() { stop(); }

std::string StubExporterServer::baseURL() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

void StubExporterServer::addFile(const std::string& path, std::string content) {
    std::lock_guard lock(mutex_);
    files_[path] = std::move(content);
}

void StubExporterServer::addObject(const std::string& target, std::string json) {
    std::lock_guard lock(mutex_);
    objects_[target] = std::move(json);
}

std::string StubExporterServer::uploaded(const std::string& path) const {
    std::lock_guard lock(mutex_);
    const auto it = uploads_.find(path);
    return it == uploads_.end() ? std::string{} : it->second;
}

std::map<std::string, std::string> StubExporterServer::lastPutHeaders() const {
    std::lock_guard lock(mutex_);
    return lastPutHeaders_;
}

void StubExporterServer::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }

    ioc_.stop();
    if (ioThread_.joinable()) ioThread_.join();
    {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    std::vector<std::thread> sessions;
    {
        std::lock_guard lock(mutex_);
        for (const auto& s : sockets_) {
            beast::error_code ec;
            s->shutdown(tcp::socket::shutdown_both, ec);
        }
        sessions.swap(sessions_);
    }
    for (auto& t : sessions) if (t.joinable()) t.join();
}

void StubExporterServer::doAccept() {
    acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
        if (ec) return; // acceptor closed

        auto sock = std::make_shared<tcp::socket>(std::move(socket));
        {
            std::lock_guard lock(mutex_);
            if (stopped_) return;
            sockets_.push_back(sock);
            sessions_.emplace_back([this, sock] { serve(sock); });
        }
        doAccept();
    });
}

void StubExporterServer::serve(const std::shared_ptr<tcp::socket> socket) {
    beast::flat_buffer buffer;
    for (;;) {
        Request req;
        beast::error_code ec;
        http::read(*socket, buffer, req, ec);
        if (ec) return;

        auto res = handle(req);
        res.keep_alive(req.keep_alive());
        http::write(*socket, res, ec);
        if (ec || !req.keep_alive()) return;
    }
}

std::string StubExporterServer::listing(const std::string& dir) const {
    std::set<std::pair<std::string, std::string>> items;
    for (const auto& [path, _] : files_) {
        if (!path.starts_with(dir) || path.size() == dir.size()) continue;
        const auto rest = path.substr(dir.size());
        const auto slash = rest.find('/');
        if (slash == std::string::npos) items.emplace(rest, "file");
        else items.emplace(rest.substr(0, slash), "dir");
    }

    auto arr = nlohmann::json::array();
    for (const auto& [name, type] : items) arr.push_back({{"name", name}, {"type", type}});
    return nlohmann::json{{"items", arr}}.dump();
}

StubExporterServer::Response StubExporterServer::handle(const Request& req) {
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, "d8-stub-exporter");

    const std::string target(req.target());

    if (target == "/slow") {
        std::this_thread::sleep_for(slowDelay_);
        res.body() = "slow";
        res.prepare_payload();
        return res;
    }

    if (req.method() == http::verb::head && target == "/api/v1/block") {
        res.content_length(blockSize_);
        return res;
    }

    if (req.method() == http::verb::get) {
        std::lock_guard lock(mutex_);
        if (const auto it = objects_.find(target); it != objects_.end()) {
            res.set(http::field::content_type, "application/json");
            res.body() = it->second;
            res.prepare_payload();
            return res;
        }
    }

    if (!target.starts_with(kFilesPrefix)) {
        res.result(http::status::not_found);
        res.body() = "no such endpoint";
        res.prepare_payload();
        return res;
    }

    const auto path = target.substr(kFilesPrefix.size());
    std::lock_guard lock(mutex_);

    switch (req.method()) {
    case http::verb::get:
        if (path.ends_with('/')) {
            res.set(http::field::content_type, "application/json");
            res.body() = listing(path);
        } else if (const auto it = files_.find(path); it != files_.end()) {
            res.body() = it->second;
        } else {
            res.result(http::status::not_found);
            res.body() = "file not found: " + path;
        }
        res.prepare_payload();
        return res;

    case http::verb::head:
        if (const auto it = uploads_.find(path); it != uploads_.end()) {
            res.set("X-Next-Offset", std::to_string(it->second.size()));
        } else {
            res.result(http::status::not_found);
        }
        res.content_length(0);
        return res;

    case http::verb::put: {
        lastPutHeaders_.clear();
        for (const auto& field : req) lastPutHeaders_[std::string(field.name_string())] = std::string(field.value());

        const auto offset = std::stoull(std::string(req["X-Offset"]));
        auto& data = uploads_[path];
        if (offset > data.size()) {
            res.result(http::status::conflict);
            res.body() = "offset beyond current size";
            res.prepare_payload();
            return res;
        }
        data.resize(offset);
        data += req.body();
        res.set("X-Next-Offset", std::to_string(data.size()));
        res.prepare_payload();
        return res;
    }

    default:
        res.result(http::status::method_not_allowed);
        res.prepare_payload();
        return res;
    }
}

}
