#include "domain/Validation.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

#include "domain/Errors.hpp"

namespace {

bool is_space(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string_view trim_view(std::string_view value) {
    while (!value.empty() && is_space(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<double> finite_or_empty(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_text(std::string_view text) {
    text = trim_view(text);
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', JSON-ish senders do not emit one either.
    double value = 0.0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, std::chars_format::general);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return finite_or_empty(value);
}

}  // namespace

namespace domain::validation {

std::optional<double> parse_number(const RawNumber& raw) {
    if (const auto* number = std::get_if<double>(&raw)) {
        return finite_or_empty(*number);
    }
    return parse_text(std::get<std::string>(raw));
}

ObservationCandidate validate(const RawObservation& raw) {
    if (!raw.symbol) {
        throw ValidationError(std::string{kMissingSymbol});
    }
    // Blank means missing; a valid symbol is stored exactly as sent.
    if (trim_view(*raw.symbol).empty()) {
        throw ValidationError(std::string{kMissingSymbol});
    }

    const auto price = raw.price ? parse_number(*raw.price) : std::nullopt;
    if (!price || !(*price > 0.0)) {
        throw ValidationError(std::string{kInvalidPrice});
    }

    const auto atr = raw.atr ? parse_number(*raw.atr) : std::nullopt;
    if (!atr || !(*atr >= 0.0)) {
        throw ValidationError(std::string{kInvalidAtr});
    }

    return ObservationCandidate{*raw.symbol, *price, *atr};
}

}  // namespace domain::validation
