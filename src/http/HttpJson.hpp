#pragma once

#include <cstdint>
#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace tvh::http {

std::string status_reason(int statusCode);

std::string serialize_json(const boost::json::value& value);

// Serializa un valor JSON a la respuesta y establece los metadatos básicos.
void write_json(tvh::api::Response& response, const boost::json::value& value, int statusCode = 200);

// ISO-8601 UTC with microseconds, e.g. 2024-03-01T14:30:05.123456Z.
std::string format_utc_timestamp(std::int64_t microsSinceEpoch);

}  // namespace tvh::http
