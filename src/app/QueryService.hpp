#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

struct HealthReport {
    bool healthy{false};
    std::size_t symbols{0};
    std::uint64_t observations{0};
    std::string error;
};

// Read side of the store. Storage failures propagate as domain::StorageError,
// except for health(), which turns them into a degraded report.
class QueryService {
public:
    explicit QueryService(std::shared_ptr<const domain::contracts::IObservationStore> store);

    std::vector<domain::Observation> latest() const;

    std::vector<domain::Observation> history(std::optional<int> limit) const;

    HealthReport health() const;

private:
    std::shared_ptr<const domain::contracts::IObservationStore> store_;
};

}  // namespace app
