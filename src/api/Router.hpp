#pragma once

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "api/Controllers.hpp"

namespace tvh::api {

class Router {
public:
    explicit Router(std::shared_ptr<const Controllers> controllers);

    // Never throws: handler exceptions become a 500 response.
    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    void add(const std::string& method, const std::string& path, Handler handler);

    std::shared_ptr<const Controllers> controllers_;
    std::map<std::string, Handler> routes_;
    std::set<std::string> knownPaths_;
};

}  // namespace tvh::api
