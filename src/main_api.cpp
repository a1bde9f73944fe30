#include <cstdlib>
#include <csignal>
#include <cstdio>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "adapters/duckdb/DuckObservationStore.hpp"
#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/IngestionService.hpp"
#include "app/QueryService.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = tvh::common::Config::fromArgs(argc, argv);
        tvh::log::setLevel(config.logLevel);

        LOG_INFO("Configuración cargada");
        LOG_INFO("  Puerto: " << config.port);
        LOG_INFO("  Nivel de log: " << tvh::log::levelToString(config.logLevel));
        LOG_INFO("  Hilos de trabajo: " << config.threads);
        LOG_INFO("  DuckDB: " << config.duckdbPath);
        LOG_INFO("  Lock timeout: " << config.lockTimeoutMs << " ms");
        LOG_INFO("  Max body: " << config.maxBodyBytes << " bytes");

        auto store = std::make_shared<adapters::duckdb::DuckObservationStore>(
            config.duckdbPath, std::chrono::milliseconds(config.lockTimeoutMs));

        auto ingestion = std::make_shared<const app::IngestionService>(store);
        auto query = std::make_shared<const app::QueryService>(store);
        auto controllers = std::make_shared<const tvh::api::Controllers>(ingestion, query, config.threads);
        auto router = std::make_shared<const tvh::api::Router>(controllers);

        tvh::api::Endpoint endpoint{"0.0.0.0", config.port};
        tvh::api::HttpServer server(endpoint, config.threads, router, config.maxBodyBytes);

        tvh::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();
        LOG_INFO("Servidor en marcha. Esperando webhooks...");

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Señal " << gSignalStatus << " recibida, deteniendo servicios...");

        server.stop();
        server.wait();

        // Handlers are gone; the database handle can be released.
        router.reset();
        controllers.reset();
        ingestion.reset();
        query.reset();
        store.reset();

        LOG_INFO("Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("Error fatal en la API: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
