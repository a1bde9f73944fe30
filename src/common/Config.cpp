#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace tvh::common {
namespace {

constexpr std::size_t kMaxBodyBytesCeiling = 16U * 1024U * 1024U;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint16_t parsePort(const std::string& value, const std::string& label) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Puerto inválido para " + label + ": " + value);
    }
}

std::size_t parseThreads(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U) {
            throw std::out_of_range("threads must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor de threads inválido para " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

std::size_t parseBodyLimit(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoull(value);
        if (parsed == 0U || parsed > kMaxBodyBytesCeiling) {
            throw std::out_of_range("body limit out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Valor booleano inválido para " + label + ": " + value);
}

tvh::log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return tvh::log::levelFromString(toLower(value));
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Nivel de log inválido para " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

bool isInMemoryPath(const std::string& path) noexcept {
    return path.empty() || path == ":memory:";
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envPort = std::getenv("PORT")) {
        config.port = parsePort(envPort, "PORT");
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envThreads = std::getenv("HTTP_THREADS")) {
        config.threads = parseThreads(envThreads, "HTTP_THREADS");
    }
    if (const char* envDuck = std::getenv("DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }
    if (const char* envLockTimeout = std::getenv("DB_LOCK_TIMEOUT_MS")) {
        config.lockTimeoutMs = parseDurationMs(envLockTimeout, "DB_LOCK_TIMEOUT_MS");
    }
    if (const char* envBody = std::getenv("HTTP_MAX_BODY_BYTES")) {
        config.maxBodyBytes = parseBodyLimit(envBody, "HTTP_MAX_BODY_BYTES");
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg, "--port");
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg, "--log-level");
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg, "--threads");
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto lockArg = valueFromArgs(argc, argv, "--lock-timeout-ms"); !lockArg.empty()) {
        config.lockTimeoutMs = parseDurationMs(lockArg, "--lock-timeout-ms");
    }
    if (auto bodyArg = valueFromArgs(argc, argv, "--max-body-bytes"); !bodyArg.empty()) {
        config.maxBodyBytes = parseBodyLimit(bodyArg, "--max-body-bytes");
    }
    if (auto corsEnableArg = valueFromArgs(argc, argv, "--http.cors.enable"); !corsEnableArg.empty()) {
        config.httpCorsEnable = parseBool(corsEnableArg, "--http.cors.enable");
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }

    return config;
}

}  // namespace tvh::common
