#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

void runStatement(::duckdb::Connection& connection, const char* sql, const char* what) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown error"};
        throw domain::StorageError(std::string{"DuckStore: "} + what + " failed: " + errorMessage);
    }
}

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    try {
        if (inMemory()) {
            database_ = std::make_unique<::duckdb::DuckDB>(nullptr);
            LOG_INFO("DuckStore opened in-memory database");
            return;
        }

        const fs::path path{dbPath_};
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw domain::StorageError("DuckStore: unable to create directory '" +
                                           path.parent_path().string() + "': " + ec.message());
            }
        }

        database_ = std::make_unique<::duckdb::DuckDB>(path.string());
        LOG_INFO("DuckStore opened " << path.string());
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw domain::StorageError("DuckStore: unable to open '" + dbPath_ + "': " + ex.what());
    }
}

DuckStore::~DuckStore() = default;

bool DuckStore::inMemory() const noexcept {
    return tvh::common::isInMemoryPath(dbPath_);
}

std::unique_ptr<::duckdb::Connection> DuckStore::connect() const {
    try {
        return std::make_unique<::duckdb::Connection>(*database_);
    }
    catch (const std::exception& ex) {
        throw domain::StorageError(std::string{"DuckStore: unable to open connection: "} + ex.what());
    }
}

void DuckStore::migrate() {
    static constexpr auto kCreateObservationsTable = R"SQL(
        CREATE TABLE IF NOT EXISTS observations (
            id BIGINT PRIMARY KEY,
            symbol VARCHAR NOT NULL,
            price DOUBLE NOT NULL,
            atr DOUBLE NOT NULL,
            ts BIGINT NOT NULL
        )
    )SQL";

    static constexpr auto kCreateSymbolTsIndex =
        "CREATE INDEX IF NOT EXISTS idx_observations_symbol_ts ON observations(symbol, ts)";

    auto connection = connect();
    try {
        runStatement(*connection, kCreateObservationsTable, "create observations table");
        runStatement(*connection, kCreateSymbolTsIndex, "create symbol/ts index");
    }
    catch (const domain::StorageError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw domain::StorageError(std::string{"DuckStore: migration failed: "} + ex.what());
    }

    LOG_INFO("DuckStore migration finished for " << (inMemory() ? std::string{":memory:"} : dbPath_));
}

}  // namespace adapters::duckdb
