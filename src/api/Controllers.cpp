#include "api/Controllers.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "app/IngestionService.hpp"
#include "app/QueryService.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Models.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/QueryParams.hpp"
#include "http/json_error.hpp"

namespace tvh::api {

namespace {

constexpr char kServiceName[] = "TradingView Webhook Receiver";
constexpr char kWebhookRouteKey[] = "POST /webhook";
constexpr char kLatestRouteKey[] = "GET /api/v1/latest";
constexpr char kObservationsRouteKey[] = "GET /api/v1/observations";

std::optional<std::string> string_field(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    const auto& text = value->get_string();
    return std::string{text.data(), text.size()};
}

// Numbers keep their value; strings are left for the validator to parse.
std::optional<domain::RawNumber> number_field(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number()) {
        return domain::RawNumber{value->to_number<double>()};
    }
    if (value->is_string()) {
        const auto& text = value->get_string();
        return domain::RawNumber{std::string{text.data(), text.size()}};
    }
    return std::nullopt;
}

std::optional<domain::RawObservation> parse_webhook_body(const std::string& body) {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(body, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }
    const auto& object = parsed.get_object();

    domain::RawObservation raw;
    raw.symbol = string_field(object, "symbol");
    raw.price = number_field(object, "price");
    raw.atr = number_field(object, "atr");
    return raw;
}

boost::json::object observation_summary(const domain::Observation& observation) {
    boost::json::object data;
    data["symbol"] = observation.symbol;
    data["price"] = observation.price;
    data["atr"] = observation.atr;
    data["exit_price"] = observation.exitPrice();
    return data;
}

boost::json::object observation_record(const domain::Observation& observation) {
    auto record = observation_summary(observation);
    record["timestamp"] = tvh::http::format_utc_timestamp(observation.timestamp);
    return record;
}

Response observation_list(const std::vector<domain::Observation>& rows) {
    boost::json::array data;
    data.reserve(rows.size());
    for (const auto& row : rows) {
        data.emplace_back(observation_record(row));
    }

    boost::json::object payload;
    payload["count"] = static_cast<std::uint64_t>(rows.size());
    payload["data"] = std::move(data);

    Response response{};
    tvh::http::write_json(response, payload);
    return response;
}

}  // namespace

Controllers::Controllers(std::shared_ptr<const app::IngestionService> ingestion,
                         std::shared_ptr<const app::QueryService> query,
                         std::size_t workerThreads)
    : ingestion_(std::move(ingestion)), query_(std::move(query)), workerThreads_(workerThreads) {
    if (!ingestion_ || !query_) {
        throw std::invalid_argument("Controllers requires ingestion and query services");
    }
}

Response Controllers::root(const Request&) const {
    boost::json::object endpoints;
    endpoints["webhook"] = "/webhook (POST)";
    endpoints["health"] = "/health (GET)";
    endpoints["latest"] = "/api/v1/latest (GET)";
    endpoints["observations"] = "/api/v1/observations (GET)";
    endpoints["stats"] = "/stats (GET)";

    boost::json::object payload;
    payload["status"] = "online";
    payload["service"] = kServiceName;
    payload["endpoints"] = std::move(endpoints);

    Response response{};
    tvh::http::write_json(response, payload);
    return response;
}

Response Controllers::health(const Request&) const {
    const auto report = query_->health();

    boost::json::object payload;
    if (report.healthy) {
        payload["status"] = "healthy";
        payload["database"] = "connected";
        payload["records_count"] = static_cast<std::uint64_t>(report.symbols);
        payload["observations_count"] = report.observations;
    }
    else {
        payload["status"] = "unhealthy";
        payload["database"] = "error";
        payload["error"] = report.error;
    }

    Response response{};
    tvh::http::write_json(response, payload);
    return response;
}

Response Controllers::webhook(const Request& request) const {
    common::metrics::Registry::ScopedTimer requestTimer(kWebhookRouteKey);

    Response response{};

    const auto raw = parse_webhook_body(request.body);
    if (!raw) {
        LOG_WARN("Controllers::webhook invalid JSON body bytes=" << request.body.size());
        tvh::http::json_error(response, 400, tvh::http::errors::invalid_json_body);
        return response;
    }

    domain::Observation stored;
    try {
        stored = ingestion_->ingest(*raw);
    }
    catch (const domain::ValidationError& ex) {
        tvh::http::json_error(response, 400, ex.what());
        return response;
    }
    catch (const domain::StorageError&) {
        tvh::http::json_error(response, 500, tvh::http::errors::store_failed);
        return response;
    }

    boost::json::object payload;
    payload["status"] = "success";
    payload["message"] = "Data for " + stored.symbol + " received and stored";
    payload["data"] = observation_summary(stored);

    tvh::http::write_json(response, payload);
    return response;
}

Response Controllers::latest(const Request&) const {
    common::metrics::Registry::ScopedTimer requestTimer(kLatestRouteKey);

    try {
        return observation_list(query_->latest());
    }
    catch (const domain::StorageError&) {
        Response response{};
        tvh::http::json_error(response, 500, tvh::http::errors::load_failed);
        return response;
    }
}

Response Controllers::observations(const Request& request) const {
    common::metrics::Registry::ScopedTimer requestTimer(kObservationsRouteKey);

    std::optional<int> limit;
    if (const auto rawLimit = tvh::http::opt_string(request, "limit")) {
        limit = tvh::http::opt_int(request, "limit");
        if (!limit) {
            LOG_WARN("Controllers::observations invalid limit query=" << request.query);
            Response response{};
            tvh::http::json_error(response, 400, tvh::http::errors::invalid_limit);
            return response;
        }
    }

    try {
        return observation_list(query_->history(limit));
    }
    catch (const domain::StorageError&) {
        Response response{};
        tvh::http::json_error(response, 500, tvh::http::errors::load_failed);
        return response;
    }
}

Response Controllers::stats(const Request&) const {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object entry;
        entry["requests"] = metrics.totalRequests;
        if (metrics.p95Ms.has_value()) {
            entry["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.p99Ms.has_value()) {
            entry["p99_ms"] = *metrics.p99Ms;
        }
        routes[route] = std::move(entry);
    }

    boost::json::object counters;
    for (const auto& [name, value] : snapshot.counters) {
        counters[name] = value;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = static_cast<std::uint64_t>(workerThreads_);
    payload["routes"] = std::move(routes);
    payload["counters"] = std::move(counters);

    Response response{};
    tvh::http::write_json(response, payload);
    return response;
}

}  // namespace tvh::api
