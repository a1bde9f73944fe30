#include "adapters/duckdb/DuckObservationStore.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr auto kInsertObservation =
    "INSERT INTO observations (id, symbol, price, atr, ts) VALUES (?, ?, ?, ?, ?)";

constexpr auto kSelectLatestPerSymbol = R"SQL(
    WITH ranked AS (
        SELECT id, symbol, price, atr, ts,
               ROW_NUMBER() OVER (PARTITION BY symbol ORDER BY ts DESC, id DESC) AS rn
        FROM observations
    )
    SELECT id, symbol, price, atr, ts
    FROM ranked
    WHERE rn = 1
    ORDER BY ts DESC, id DESC
)SQL";

constexpr auto kSelectAll = "SELECT id, symbol, price, atr, ts FROM observations ORDER BY ts DESC, id DESC";

constexpr auto kSelectAllLimited =
    "SELECT id, symbol, price, atr, ts FROM observations ORDER BY ts DESC, id DESC LIMIT ?";

domain::TimestampUs nowUs() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

[[noreturn]] void fail(const std::string& operation, const std::string& message) {
    LOG_WARN("DuckObservationStore " << operation << " failed: " << message);
    throw domain::StorageError("DuckObservationStore " + operation + " failed: " + message);
}

template <typename Result>
void checkResult(const Result& result, const std::string& operation) {
    if (!result) {
        fail(operation, "no result");
    }
    if (result->HasError()) {
        fail(operation, result->GetError());
    }
}

std::vector<domain::Observation> fetchObservations(::duckdb::QueryResult& result, const std::string& operation) {
    std::vector<domain::Observation> rows;
    while (auto chunk = result.Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::Observation observation{};
            observation.id = chunk->GetValue(0, row).GetValue<std::int64_t>();
            observation.symbol = chunk->GetValue(1, row).GetValue<std::string>();
            observation.price = chunk->GetValue(2, row).GetValue<double>();
            observation.atr = chunk->GetValue(3, row).GetValue<double>();
            observation.timestamp = chunk->GetValue(4, row).GetValue<std::int64_t>();
            rows.push_back(std::move(observation));
        }
    }
    if (result.HasError()) {
        fail(operation, result.GetError());
    }
    return rows;
}

}  // namespace

DuckObservationStore::DuckObservationStore(std::string dbPath, std::chrono::milliseconds lockTimeout, Clock clock)
    : store_(std::move(dbPath)), lockTimeout_(lockTimeout), clock_(clock ? std::move(clock) : Clock{nowUs}) {
    store_.migrate();

    writer_ = store_.connect();
    try {
        insert_ = writer_->Prepare(kInsertObservation);
    }
    catch (const std::exception& ex) {
        fail("prepare insert", ex.what());
    }
    checkResult(insert_, "prepare insert");

    seedCounters();
}

DuckObservationStore::~DuckObservationStore() = default;

void DuckObservationStore::seedCounters() {
    std::lock_guard<std::timed_mutex> lock(writerMutex_);
    try {
        auto result = writer_->Query("SELECT COALESCE(MAX(id), 0), COALESCE(MAX(ts), 0) FROM observations");
        checkResult(result, "seed counters");
        if (result->RowCount() > 0) {
            lastId_ = result->GetValue(0, 0).GetValue<std::int64_t>();
            lastTimestamp_ = result->GetValue(1, 0).GetValue<std::int64_t>();
        }
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        fail("seed counters", ex.what());
    }
    LOG_DEBUG("DuckObservationStore counters last_id=" << lastId_ << " last_ts=" << lastTimestamp_);
}

domain::Observation DuckObservationStore::append(const domain::Symbol& symbol, double price, double atr) {
    std::unique_lock<std::timed_mutex> lock(writerMutex_, std::defer_lock);
    if (!lock.try_lock_for(lockTimeout_)) {
        fail("append", "writer lock not acquired within " + std::to_string(lockTimeout_.count()) + " ms");
    }

    domain::Observation observation{};
    observation.id = lastId_ + 1;
    observation.symbol = symbol;
    observation.price = price;
    observation.atr = atr;
    // The wall clock may step back; insertion order must not.
    observation.timestamp = std::max(clock_(), lastTimestamp_);

    try {
        DuckdbValueVector parameters;
        parameters.reserve(5);
        parameters.emplace_back(::duckdb::Value::BIGINT(observation.id));
        parameters.emplace_back(::duckdb::Value(observation.symbol));
        parameters.emplace_back(::duckdb::Value::DOUBLE(observation.price));
        parameters.emplace_back(::duckdb::Value::DOUBLE(observation.atr));
        parameters.emplace_back(::duckdb::Value::BIGINT(observation.timestamp));

        auto result = insert_->Execute(parameters);
        checkResult(result, "append");
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        fail("append", ex.what());
    }

    // Committed: only now may the next writer build on these values.
    lastId_ = observation.id;
    lastTimestamp_ = observation.timestamp;

    LOG_DEBUG("DuckObservationStore append id=" << observation.id << " symbol=" << observation.symbol
                                                << " ts=" << observation.timestamp);
    return observation;
}

std::vector<domain::Observation> DuckObservationStore::latestPerSymbol() const {
    try {
        auto connection = store_.connect();
        auto result = connection->Query(kSelectLatestPerSymbol);
        checkResult(result, "latestPerSymbol");
        return fetchObservations(*result, "latestPerSymbol");
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        fail("latestPerSymbol", ex.what());
    }
}

std::vector<domain::Observation> DuckObservationStore::all(std::optional<int> limit) const {
    const bool bounded = limit.has_value() && *limit > 0;
    try {
        auto connection = store_.connect();
        if (!bounded) {
            auto result = connection->Query(kSelectAll);
            checkResult(result, "all");
            return fetchObservations(*result, "all");
        }

        auto statement = connection->Prepare(kSelectAllLimited);
        checkResult(statement, "prepare all");

        DuckdbValueVector parameters;
        parameters.emplace_back(::duckdb::Value::BIGINT(*limit));
        auto result = statement->Execute(parameters);
        checkResult(result, "all");
        return fetchObservations(*result, "all");
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        fail("all", ex.what());
    }
}

std::uint64_t DuckObservationStore::count() const {
    try {
        auto connection = store_.connect();
        auto result = connection->Query("SELECT COUNT(*) FROM observations");
        checkResult(result, "count");
        if (result->RowCount() == 0) {
            return 0U;
        }
        const auto value = result->GetValue(0, 0);
        if (value.IsNull()) {
            return 0U;
        }
        return static_cast<std::uint64_t>(value.GetValue<std::int64_t>());
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        fail("count", ex.what());
    }
}

}  // namespace adapters::duckdb
