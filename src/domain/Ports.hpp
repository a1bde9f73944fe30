#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "domain/Models.hpp"

namespace domain::contracts {

// Append-only observation log. Every method throws domain::StorageError when
// the medium fails; an empty result is never used to signal failure.
class IObservationStore {
public:
    virtual ~IObservationStore() = default;

    // Assigns id and timestamp and commits atomically.
    virtual Observation append(const Symbol& symbol, double price, double atr) = 0;

    // One row per symbol, max (timestamp, id), most recently updated symbol first.
    virtual std::vector<Observation> latestPerSymbol() const = 0;

    // Newest first. No limit, or limit <= 0, returns every row.
    virtual std::vector<Observation> all(std::optional<int> limit) const = 0;

    virtual std::uint64_t count() const = 0;
};

}  // namespace domain::contracts
