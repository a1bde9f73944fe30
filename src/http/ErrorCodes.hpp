#pragma once

#include <string_view>

// Client-facing "detail" messages. Validation messages live in domain/Validation.hpp.
namespace tvh::http::errors {

inline constexpr std::string_view invalid_json_body = "invalid JSON body";
inline constexpr std::string_view invalid_limit = "invalid limit";
inline constexpr std::string_view store_failed = "Failed to store data";
inline constexpr std::string_view load_failed = "Failed to load data";
inline constexpr std::string_view internal_error = "Internal error";
inline constexpr std::string_view bad_request = "Bad Request";
inline constexpr std::string_view not_found = "Not Found";
inline constexpr std::string_view method_not_allowed = "Method Not Allowed";
inline constexpr std::string_view payload_too_large = "Payload Too Large";

}  // namespace tvh::http::errors
