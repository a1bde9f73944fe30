#include "api/Router.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace tvh::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

// "/health/" and "/health" are the same route; "/" stays as is.
std::string normalizePath(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

}  // namespace

Router::Router(std::shared_ptr<const Controllers> controllers) : controllers_(std::move(controllers)) {
    if (!controllers_) {
        throw std::invalid_argument("Router requires controllers");
    }

    const auto* c = controllers_.get();
    add("GET", "/", [c](const Request& request) { return c->root(request); });
    add("GET", "/health", [c](const Request& request) { return c->health(request); });
    add("POST", "/webhook", [c](const Request& request) { return c->webhook(request); });
    add("GET", "/api/v1/latest", [c](const Request& request) { return c->latest(request); });
    add("GET", "/api/v1/observations", [c](const Request& request) { return c->observations(request); });
    add("GET", "/stats", [c](const Request& request) { return c->stats(request); });
}

void Router::add(const std::string& method, const std::string& path, Handler handler) {
    routes_.emplace(makeKey(method, path), std::move(handler));
    knownPaths_.insert(path);
}

Response Router::handle(const Request& request) const {
    Response response{};
    const auto path = normalizePath(request.path);
    const auto key = makeKey(request.method, path);

    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        if (knownPaths_.count(path) != 0) {
            tvh::http::json_error(response, 405, tvh::http::errors::method_not_allowed);
        }
        else {
            tvh::http::json_error(response, 404, tvh::http::errors::not_found);
        }
        LOG_DEBUG("Router: " << response.statusCode << " for " << request.method << ' ' << request.path);
        return response;
    }

    common::metrics::Registry::instance().incrementRequest(key);
    tvh::log::ScopedContext logContext(key);
    try {
        return it->second(request);
    }
    catch (const std::exception& ex) {
        LOG_ERR("Router: unhandled error on " << key << ": " << ex.what());
        tvh::http::json_error(response, 500, tvh::http::errors::internal_error);
        return response;
    }
}

}  // namespace tvh::api
