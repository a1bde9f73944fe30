#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the process-wide DuckDB database handle and its schema.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/investment_data.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Idempotent: creates the observations table and its (symbol, ts) index.
    void migrate();

    // A new connection on the shared handle. Each connection is used by one thread at a time.
    std::unique_ptr<::duckdb::Connection> connect() const;

    const std::string& path() const noexcept { return dbPath_; }
    bool inMemory() const noexcept;

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
};

}  // namespace adapters::duckdb
