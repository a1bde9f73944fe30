#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "common/Log.hpp"
#include "http/ErrorCodes.hpp"
#include "http/RequestParser.hpp"
#include "http/json_error.hpp"

namespace tvh::api {

namespace {

constexpr std::size_t kMaxHeaderBytes = 8192;
constexpr int kClientRecvTimeoutSeconds = 10;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint, std::uint16_t port) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(port);
    }
    return endpoint.address + ':' + std::to_string(port);
}

Response errorResponse(int statusCode, std::string_view detail) {
    Response response{};
    tvh::http::json_error(response, statusCode, detail);
    return response;
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint,
                       std::size_t threadCount,
                       std::shared_ptr<const Router> router,
                       std::size_t maxBodyBytes)
    : endpoint_(std::move(endpoint)),
      threadCount_(threadCount ? threadCount : 1),
      router_(std::move(router)),
      maxBodyBytes_(maxBodyBytes) {
    if (!router_) {
        throw std::invalid_argument("HttpServer requires a router");
    }
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("No se pudo crear el socket del servidor: " + describeErrno(errno));
    }

    int opt = 1;
    ::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
            ::close(serverFd_);
            serverFd_ = -1;
            running_.store(false);
            throw std::runtime_error("Dirección inválida: " + endpoint_.address);
        }
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("No se pudo enlazar el socket: " + message);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("No se pudo iniciar la escucha: " + message);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(serverFd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_.store(ntohs(bound.sin_port));
    } else {
        boundPort_.store(endpoint_.port);
    }

    LOG_INFO("HTTP server escuchando en " << formatAddress(endpoint_, boundPort_.load()));

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i, listenFd = serverFd_]() { workerLoop(i, listenFd); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // shutdown() wakes the workers blocked in accept(); the descriptor is only
    // closed once they are joined so its number cannot be reused under them.
    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    if (serverFd_ >= 0) {
        ::close(serverFd_);
        serverFd_ = -1;
    }
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId, int listenFd) {
    LOG_DEBUG("Worker " << workerId << " iniciado");

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(listenFd, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN("Error aceptando conexión: " << describeErrno(errno));
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = kClientRecvTimeoutSeconds;
        ::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        handleClient(clientFd);

        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
    }

    LOG_DEBUG("Worker " << workerId << " finalizado");
}

void HttpServer::handleClient(int clientFd) {
    std::string request;
    request.reserve(1024);
    char buffer[4096];

    std::size_t headerEnd = std::string::npos;
    while ((headerEnd = request.find(tvh::http::kHeaderTerminator)) == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        request.append(buffer, static_cast<std::size_t>(bytes));
        if (request.size() > kMaxHeaderBytes) {
            break;
        }
    }

    if (headerEnd == std::string::npos) {
        if (!request.empty()) {
            sendResponse(clientFd, errorResponse(400, tvh::http::errors::bad_request));
        }
        return;
    }

    auto apiRequest = tvh::http::parse_request_head(std::string_view(request).substr(0, headerEnd));
    if (!apiRequest) {
        sendResponse(clientFd, errorResponse(400, tvh::http::errors::bad_request));
        return;
    }

    const auto length = tvh::http::content_length(*apiRequest);
    if (!length) {
        sendResponse(clientFd, errorResponse(400, tvh::http::errors::bad_request));
        return;
    }
    if (*length > maxBodyBytes_) {
        LOG_WARN("Cuerpo demasiado grande: " << *length << " bytes en " << apiRequest->path);
        sendResponse(clientFd, errorResponse(413, tvh::http::errors::payload_too_large));
        return;
    }

    std::string body = request.substr(headerEnd + tvh::http::kHeaderTerminator.size());
    while (body.size() < *length) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        body.append(buffer, static_cast<std::size_t>(bytes));
    }
    if (body.size() < *length) {
        LOG_WARN("Cuerpo incompleto: " << body.size() << '/' << *length << " bytes en " << apiRequest->path);
        sendResponse(clientFd, errorResponse(400, tvh::http::errors::bad_request));
        return;
    }
    body.resize(*length);
    apiRequest->body = std::move(body);

    const auto responseData = router_->handle(*apiRequest);
    LOG_DEBUG(apiRequest->method << ' ' << apiRequest->target << " -> " << responseData.statusCode);
    sendResponse(clientFd, responseData);
}

void HttpServer::sendResponse(int clientFd, const Response& responseData) const {
    const auto& body = responseData.body;

    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    const std::string contentType = responseData.contentType.empty() ? "application/json" : responseData.contentType;
    response << "Content-Type: " << contentType << "\r\n";
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    if (corsConfig_.enabled && !corsConfig_.origin.empty()) {
        response << "Access-Control-Allow-Origin: " << corsConfig_.origin << "\r\n";
        response << "Vary: Origin\r\n";
        response << "Access-Control-Allow-Headers: Content-Type\r\n";
    }
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }
}

}  // namespace tvh::api
