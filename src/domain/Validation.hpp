#pragma once

#include <optional>
#include <string_view>

#include "domain/Models.hpp"

namespace domain::validation {

inline constexpr std::string_view kMissingSymbol = "missing symbol";
inline constexpr std::string_view kInvalidPrice = "invalid price";
inline constexpr std::string_view kInvalidAtr = "invalid atr";

// Rules run in order (symbol, price, atr); the first failure throws
// domain::ValidationError with one of the messages above.
ObservationCandidate validate(const RawObservation& raw);

// Finite value of a raw number; text must be a complete decimal literal,
// surrounding whitespace allowed.
std::optional<double> parse_number(const RawNumber& raw);

}  // namespace domain::validation
