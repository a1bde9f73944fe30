#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace domain {

using Symbol = std::string;

// Microseconds since the Unix epoch, UTC.
using TimestampUs = std::int64_t;

struct Observation {
    std::int64_t id{0};
    Symbol symbol;
    double price{0.0};
    double atr{0.0};
    TimestampUs timestamp{0};

    // Stop-loss estimate, never persisted.
    double exitPrice() const noexcept { return price - atr; }
};

// Output of the validator: what may be handed to IObservationStore::append.
struct ObservationCandidate {
    Symbol symbol;
    double price{0.0};
    double atr{0.0};
};

// A numeric field as received: a JSON number or its textual form.
using RawNumber = std::variant<double, std::string>;

struct RawObservation {
    std::optional<std::string> symbol;
    std::optional<RawNumber> price;
    std::optional<RawNumber> atr;
};

}  // namespace domain
