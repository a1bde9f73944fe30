#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace tvh::common {

struct Config {
    std::uint16_t port = 8000;
    tvh::log::Level logLevel = tvh::log::Level::Info;
    std::size_t threads = 4;
    std::string duckdbPath = "/data/investment_data.duckdb";
    std::uint32_t lockTimeoutMs = 5000;
    std::size_t maxBodyBytes = 65536;

    bool httpCorsEnable = false;
    std::string httpCorsOrigin;

    static Config fromArgs(int argc, char** argv);
};

// ":memory:" or an empty path selects an in-memory database.
bool isInMemoryPath(const std::string& path) noexcept;

}  // namespace tvh::common
