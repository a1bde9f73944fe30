#include "app/QueryService.hpp"

#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace app {

namespace metrics = tvh::common::metrics;

QueryService::QueryService(std::shared_ptr<const domain::contracts::IObservationStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("QueryService requires an observation store");
    }
}

std::vector<domain::Observation> QueryService::latest() const {
    try {
        return store_->latestPerSymbol();
    }
    catch (const domain::StorageError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kStorageErrors);
        LOG_ERR("Latest-per-symbol query failed: " << ex.what());
        throw;
    }
}

std::vector<domain::Observation> QueryService::history(std::optional<int> limit) const {
    try {
        return store_->all(limit);
    }
    catch (const domain::StorageError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kStorageErrors);
        LOG_ERR("History query failed limit=" << (limit ? std::to_string(*limit) : std::string{"none"}) << ": "
                                              << ex.what());
        throw;
    }
}

HealthReport QueryService::health() const {
    HealthReport report{};
    try {
        report.symbols = store_->latestPerSymbol().size();
        report.observations = store_->count();
        report.healthy = true;
    }
    catch (const domain::StorageError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kStorageErrors);
        LOG_WARN("Health check: database unavailable: " << ex.what());
        report.healthy = false;
        report.error = ex.what();
    }
    return report;
}

}  // namespace app
