#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace tvh::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking HTTP/1.1 server: every worker thread accepts and serves one
// connection at a time, one request per connection.
class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    HttpServer(Endpoint endpoint,
               std::size_t threadCount,
               std::shared_ptr<const Router> router,
               std::size_t maxBodyBytes);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);

    // Port actually bound; differs from the endpoint when it asked for port 0.
    std::uint16_t boundPort() const noexcept { return boundPort_.load(); }

private:
    void workerLoop(std::size_t workerId, int listenFd);
    void handleClient(int clientFd);
    void sendResponse(int clientFd, const Response& responseData) const;

    Endpoint endpoint_;
    std::size_t threadCount_;
    std::shared_ptr<const Router> router_;
    std::size_t maxBodyBytes_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
    // Written only by the thread that calls start() and stop().
    int serverFd_ = -1;
    CorsConfig corsConfig_{};
};

}  // namespace tvh::api
