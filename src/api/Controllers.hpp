#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace app {
class IngestionService;
class QueryService;
}  // namespace app

namespace tvh::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    // Header names are lower-cased by the parser.
    std::map<std::string, std::string> headers;
    std::string body;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

class Controllers {
public:
    Controllers(std::shared_ptr<const app::IngestionService> ingestion,
                std::shared_ptr<const app::QueryService> query,
                std::size_t workerThreads);

    Response root(const Request& request) const;

    Response health(const Request& request) const;

    // POST /webhook
    Response webhook(const Request& request) const;

    // GET /api/v1/latest
    Response latest(const Request& request) const;

    // GET /api/v1/observations?limit=N
    Response observations(const Request& request) const;

    Response stats(const Request& request) const;

private:
    std::shared_ptr<const app::IngestionService> ingestion_;
    std::shared_ptr<const app::QueryService> query_;
    std::size_t workerThreads_;
};

}  // namespace tvh::api
