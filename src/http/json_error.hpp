#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace tvh::http {

// Serializa un error JSON con el formato {"detail":"..."} y ajusta la respuesta HTTP.
void json_error(tvh::api::Response& response, int statusCode, std::string_view detail);

}  // namespace tvh::http
