#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Ports.hpp"

namespace duckdb {
class PreparedStatement;
}  // namespace duckdb

namespace adapters::duckdb {

class DuckObservationStore : public domain::contracts::IObservationStore {
public:
    // Wall clock in microseconds; called once per append while the writer lock is held.
    using Clock = std::function<domain::TimestampUs()>;

    // An empty clock selects the system clock.
    DuckObservationStore(std::string dbPath, std::chrono::milliseconds lockTimeout, Clock clock = {});
    ~DuckObservationStore() override;

    domain::Observation append(const domain::Symbol& symbol, double price, double atr) override;

    std::vector<domain::Observation> latestPerSymbol() const override;

    std::vector<domain::Observation> all(std::optional<int> limit) const override;

    std::uint64_t count() const override;

private:
    void seedCounters();

    DuckStore store_;
    std::chrono::milliseconds lockTimeout_;
    Clock clock_;

    // Guards the writer connection, its statement and the counters below.
    std::timed_mutex writerMutex_;
    std::unique_ptr<::duckdb::Connection> writer_;
    std::unique_ptr<::duckdb::PreparedStatement> insert_;
    std::int64_t lastId_{0};
    domain::TimestampUs lastTimestamp_{0};
};

}  // namespace adapters::duckdb
