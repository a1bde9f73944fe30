#pragma once

#include <optional>
#include <string>

#include "api/Controllers.hpp"

namespace tvh::http {

std::optional<std::string> opt_string(const tvh::api::Request& request, const char* key);

std::optional<int> opt_int(const tvh::api::Request& request, const char* key);

}  // namespace tvh::http
