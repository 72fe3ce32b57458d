#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace d8::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// Plain-HTTP stand-in for the in-cluster exporter on 127.0.0.1:
//   GET  /api/v1/files/<dir>/   -> {"items":[...]} built from the stored files
//   GET  /api/v1/files/<file>   -> file body, 404 when unknown
//   HEAD /api/v1/block          -> Content-Length of the block device
//   HEAD /api/v1/files/<file>   -> X-Next-Offset of a partial upload, 404 when none
//   PUT  /api/v1/files/<file>   -> writes the body at X-Offset
//   GET  /slow                  -> replies after slowDelay
//   GET  <any other path>       -> a JSON object stored with addObject
class StubExporterServer {
public:
    StubExporterServer();
    ~StubExporterServer();

    StubExporterServer(const StubExporterServer&) = delete;
    StubExporterServer& operator=(const StubExporterServer&) = delete;

    [[nodiscard]] std::string baseURL() const;
    [[nodiscard]] unsigned short port() const { return port_; }

    void addFile(const std::string& path, std::string content);
    void addObject(const std::string& target, std::string json);
    void setBlockSize(uint64_t size) { blockSize_ = size; }
    void setSlowDelay(std::chrono::milliseconds d) { slowDelay_ = d; }

    [[nodiscard]] std::string uploaded(const std::string& path) const;
    [[nodiscard]] std::map<std::string, std::string> lastPutHeaders() const;

    void stop();

private:
    using Request = beast::http::request<beast::http::string_body>;
    using Response = beast::http::response<beast::http::string_body>;

    void doAccept();
    void serve(std::shared_ptr<tcp::socket> socket);
    Response handle(const Request& req);
    std::string listing(const std::string& dir) const;

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::thread ioThread_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::map<std::string, std::string> objects_;
    std::map<std::string, std::string> uploads_;
    std::map<std::string, std::string> lastPutHeaders_;
    std::vector<std::shared_ptr<tcp::socket>> sockets_;
    std::vector<std::thread> sessions_;
    uint64_t blockSize_ = 0;
    std::chrono::milliseconds slowDelay_{2000};
    bool stopped_ = false;
};

}
