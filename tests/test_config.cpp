#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

// Restores an environment variable to whatever it was when the guard was created.
struct EnvGuard {
    explicit EnvGuard(std::string variable) : name(std::move(variable)) {
        const char* current = std::getenv(name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

::tvh::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::tvh::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsConfigError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard duckGuard("DUCKDB_PATH");
    EnvGuard portGuard("PORT");
    EnvGuard levelGuard("LOG_LEVEL");
    EnvGuard threadsGuard("HTTP_THREADS");
    EnvGuard lockGuard("DB_LOCK_TIMEOUT_MS");
    EnvGuard bodyGuard("HTTP_MAX_BODY_BYTES");
    portGuard.clear();
    levelGuard.clear();
    threadsGuard.clear();
    lockGuard.clear();
    bodyGuard.clear();

    const std::string flagPath = "/tmp/tvhook/flag/observations.duckdb";
    const std::string envPath = "/tmp/tvhook/env/observations.duckdb";

    // Defaults when env and flags are absent. The path is kept in memory to
    // avoid creating the default /data directory.
    duckGuard.set(":memory:");
    auto configDefault = runConfig({"app"});
    if (configDefault.port != 8000 || configDefault.threads != 4 || configDefault.lockTimeoutMs != 5000 ||
        configDefault.maxBodyBytes != 65536 || configDefault.logLevel != tvh::log::Level::Info ||
        configDefault.httpCorsEnable) {
        std::cerr << "Unexpected defaults: port=" << configDefault.port << " threads=" << configDefault.threads
                  << " lock=" << configDefault.lockTimeoutMs << " body=" << configDefault.maxBodyBytes << "\n";
        return 1;
    }
    if (!tvh::common::isInMemoryPath(configDefault.duckdbPath)) {
        std::cerr << "Expected :memory: to select an in-memory database\n";
        return 1;
    }
    if (tvh::common::Config{}.duckdbPath != "/data/investment_data.duckdb") {
        std::cerr << "Expected default DuckDB path /data/investment_data.duckdb but got "
                  << tvh::common::Config{}.duckdbPath << "\n";
        return 1;
    }

    // Environment variables override defaults.
    duckGuard.set(envPath);
    portGuard.set("9100");
    levelGuard.set("DEBUG");
    threadsGuard.set("2");
    lockGuard.set("250");
    std::filesystem::remove_all(std::filesystem::path(envPath).parent_path());
    auto configEnv = runConfig({"app"});
    if (configEnv.duckdbPath != envPath || configEnv.port != 9100 || configEnv.threads != 2 ||
        configEnv.lockTimeoutMs != 250 || configEnv.logLevel != tvh::log::Level::Debug) {
        std::cerr << "Expected env overrides, got path=" << configEnv.duckdbPath << " port=" << configEnv.port
                  << "\n";
        return 1;
    }
    // Reading configuration has no side effects; the store creates the directory.
    if (std::filesystem::exists(std::filesystem::path(envPath).parent_path())) {
        std::cerr << "Expected configuration not to create the env path directory\n";
        return 1;
    }

    // CLI flags override environment variables.
    std::filesystem::remove_all(std::filesystem::path(flagPath).parent_path());
    auto configFlag = runConfig({"app", "--duckdb", flagPath, "--port=9200", "--threads", "8",
                                 "--max-body-bytes=1024", "--http.cors.enable", "true", "--http.cors.origin",
                                 "http://localhost:3000"});
    if (configFlag.duckdbPath != flagPath || configFlag.port != 9200 || configFlag.threads != 8 ||
        configFlag.maxBodyBytes != 1024 || !configFlag.httpCorsEnable ||
        configFlag.httpCorsOrigin != "http://localhost:3000") {
        std::cerr << "Expected flag overrides, got path=" << configFlag.duckdbPath << " port=" << configFlag.port
                  << " threads=" << configFlag.threads << "\n";
        return 1;
    }
    if (std::filesystem::exists(std::filesystem::path(flagPath).parent_path())) {
        std::cerr << "Expected configuration not to create the flag path directory\n";
        return 1;
    }

    // Invalid values are configuration errors naming the key.
    duckGuard.set(":memory:");
    portGuard.clear();
    levelGuard.clear();
    threadsGuard.clear();
    lockGuard.clear();
    if (!throwsConfigError({"app", "--port", "70000"}) || !throwsConfigError({"app", "--threads=0"}) ||
        !throwsConfigError({"app", "--log-level", "loud"}) || !throwsConfigError({"app", "--http.cors.enable=maybe"}) ||
        !throwsConfigError({"app", "--max-body-bytes", "0"}) || !throwsConfigError({"app", "--lock-timeout-ms=x"})) {
        std::cerr << "Expected invalid flag values to be rejected\n";
        return 1;
    }
    portGuard.set("not-a-port");
    if (!throwsConfigError({"app"})) {
        std::cerr << "Expected an invalid PORT environment value to be rejected\n";
        return 1;
    }

    return 0;
}
