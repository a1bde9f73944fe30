#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "api/Controllers.hpp"

namespace tvh::http {

inline constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

// Parses the request line and headers (everything before the blank line).
// Returns nullopt when the request line is not "METHOD target HTTP/x.y".
std::optional<tvh::api::Request> parse_request_head(std::string_view head);

// 0 when the header is absent, nullopt when it is not a plain decimal number.
std::optional<std::size_t> content_length(const tvh::api::Request& request);

}  // namespace tvh::http
