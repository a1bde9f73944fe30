#include "http/json_error.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "http/HttpJson.hpp"

namespace tvh::http {

void json_error(tvh::api::Response& response, int statusCode, std::string_view detail) {
    boost::json::object payload;
    payload["detail"] = boost::json::string_view{detail.data(), detail.size()};
    write_json(response, payload, statusCode);
}

}  // namespace tvh::http
