#pragma once

#include <memory>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

// The only path that creates observations: validate, then append.
class IngestionService {
public:
    explicit IngestionService(std::shared_ptr<domain::contracts::IObservationStore> store);

    // Throws domain::ValidationError before touching the store, or
    // domain::StorageError when the append is not confirmed.
    domain::Observation ingest(const domain::RawObservation& raw) const;

private:
    std::shared_ptr<domain::contracts::IObservationStore> store_;
};

}  // namespace app
