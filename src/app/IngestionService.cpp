#include "app/IngestionService.hpp"

#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Validation.hpp"

namespace app {

namespace metrics = tvh::common::metrics;

IngestionService::IngestionService(std::shared_ptr<domain::contracts::IObservationStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("IngestionService requires an observation store");
    }
}

domain::Observation IngestionService::ingest(const domain::RawObservation& raw) const {
    domain::ObservationCandidate candidate;
    try {
        candidate = domain::validation::validate(raw);
    }
    catch (const domain::ValidationError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kValidationRejected);
        LOG_WARN("Webhook rejected: " << ex.what());
        throw;
    }

    tvh::log::ScopedContext logContext("symbol=" + candidate.symbol);
    try {
        auto stored = store_->append(candidate.symbol, candidate.price, candidate.atr);
        metrics::Registry::instance().incrementCounter(metrics::kObservationsStored);
        LOG_INFO("Stored id=" << stored.id << " price=" << stored.price << " atr=" << stored.atr
                           << " exit_price=" << stored.exitPrice());
        return stored;
    }
    catch (const domain::StorageError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kStorageErrors);
        LOG_ERR("Webhook store failed: " << ex.what());
        throw;
    }
}

}  // namespace app
