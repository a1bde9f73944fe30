#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "domain/Errors.hpp"
#include "domain/Validation.hpp"

namespace {

domain::RawObservation makeRaw(std::optional<std::string> symbol,
                               std::optional<domain::RawNumber> price,
                               std::optional<domain::RawNumber> atr) {
    domain::RawObservation raw;
    raw.symbol = std::move(symbol);
    raw.price = std::move(price);
    raw.atr = std::move(atr);
    return raw;
}

// Returns the ValidationError message, or nullopt when validate() accepted the input.
std::optional<std::string> rejection(const domain::RawObservation& raw) {
    try {
        domain::validation::validate(raw);
    } catch (const domain::ValidationError& ex) {
        return std::string{ex.what()};
    }
    return std::nullopt;
}

bool expectRejected(const std::string& name, const domain::RawObservation& raw, std::string_view expected) {
    const auto message = rejection(raw);
    if (!message) {
        std::cerr << name << ": expected rejection '" << expected << "' but input was accepted\n";
        return false;
    }
    if (*message != expected) {
        std::cerr << name << ": expected '" << expected << "' but got '" << *message << "'\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using domain::RawNumber;
    namespace validation = domain::validation;

    // Accepted input, numbers as JSON numbers.
    {
        const auto candidate = validation::validate(makeRaw("AAPL", RawNumber{150.25}, RawNumber{2.35}));
        if (candidate.symbol != "AAPL" || candidate.price != 150.25 || candidate.atr != 2.35) {
            std::cerr << "Unexpected candidate for AAPL: " << candidate.symbol << ' ' << candidate.price << ' '
                      << candidate.atr << "\n";
            return 1;
        }
    }

    // Textual numbers are accepted; atr of zero is allowed.
    {
        const auto candidate = validation::validate(makeRaw("MSFT", RawNumber{std::string{" 420.5 "}},
                                                            RawNumber{std::string{"0"}}));
        if (candidate.price != 420.5 || candidate.atr != 0.0) {
            std::cerr << "Expected textual numbers to parse, got price=" << candidate.price
                      << " atr=" << candidate.atr << "\n";
            return 1;
        }
    }

    // Symbols are kept verbatim: padding and case make distinct symbols.
    {
        const auto padded = validation::validate(makeRaw(" AAPL ", RawNumber{1.0}, RawNumber{0.0}));
        const auto plain = validation::validate(makeRaw("AAPL", RawNumber{1.0}, RawNumber{0.0}));
        const auto lower = validation::validate(makeRaw("aapl", RawNumber{1.0}, RawNumber{0.0}));
        if (padded.symbol != " AAPL " || plain.symbol != "AAPL" || lower.symbol != "aapl") {
            std::cerr << "Expected symbols unchanged, got '" << padded.symbol << "', '" << plain.symbol << "', '"
                      << lower.symbol << "'\n";
            return 1;
        }
        if (padded.symbol == plain.symbol) {
            std::cerr << "Expected ' AAPL ' and 'AAPL' to be different symbols\n";
            return 1;
        }
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    bool ok = true;
    ok &= expectRejected("missing symbol", makeRaw(std::nullopt, RawNumber{1.0}, RawNumber{1.0}),
                         validation::kMissingSymbol);
    ok &= expectRejected("empty symbol", makeRaw("", RawNumber{1.0}, RawNumber{1.0}), validation::kMissingSymbol);
    ok &= expectRejected("blank symbol", makeRaw(" \t", RawNumber{1.0}, RawNumber{1.0}),
                         validation::kMissingSymbol);

    ok &= expectRejected("missing price", makeRaw("AAPL", std::nullopt, RawNumber{1.0}), validation::kInvalidPrice);
    ok &= expectRejected("zero price", makeRaw("AAPL", RawNumber{0.0}, RawNumber{1.0}), validation::kInvalidPrice);
    ok &= expectRejected("negative price", makeRaw("AAPL", RawNumber{-3.0}, RawNumber{1.0}),
                         validation::kInvalidPrice);
    ok &= expectRejected("nan price", makeRaw("AAPL", RawNumber{nan}, RawNumber{1.0}), validation::kInvalidPrice);
    ok &= expectRejected("inf price", makeRaw("AAPL", RawNumber{inf}, RawNumber{1.0}), validation::kInvalidPrice);
    ok &= expectRejected("text price", makeRaw("AAPL", RawNumber{std::string{"abc"}}, RawNumber{1.0}),
                         validation::kInvalidPrice);
    ok &= expectRejected("partial price", makeRaw("AAPL", RawNumber{std::string{"12abc"}}, RawNumber{1.0}),
                         validation::kInvalidPrice);
    ok &= expectRejected("empty price text", makeRaw("AAPL", RawNumber{std::string{""}}, RawNumber{1.0}),
                         validation::kInvalidPrice);
    ok &= expectRejected("textual inf price", makeRaw("AAPL", RawNumber{std::string{"inf"}}, RawNumber{1.0}),
                         validation::kInvalidPrice);

    ok &= expectRejected("missing atr", makeRaw("AAPL", RawNumber{1.0}, std::nullopt), validation::kInvalidAtr);
    ok &= expectRejected("negative atr", makeRaw("AAPL", RawNumber{1.0}, RawNumber{-0.01}), validation::kInvalidAtr);
    ok &= expectRejected("nan atr", makeRaw("AAPL", RawNumber{1.0}, RawNumber{nan}), validation::kInvalidAtr);
    ok &= expectRejected("text atr", makeRaw("AAPL", RawNumber{1.0}, RawNumber{std::string{"n/a"}}),
                         validation::kInvalidAtr);

    // Rules run in order: the symbol failure wins over bad numbers.
    ok &= expectRejected("first failure wins", makeRaw(std::nullopt, RawNumber{-1.0}, RawNumber{-1.0}),
                         validation::kMissingSymbol);
    ok &= expectRejected("price before atr", makeRaw("AAPL", RawNumber{-1.0}, RawNumber{-1.0}),
                         validation::kInvalidPrice);

    if (!ok) {
        return 1;
    }

    // parse_number on its own.
    if (validation::parse_number(RawNumber{std::string{"1e3"}}) != std::optional<double>{1000.0}) {
        std::cerr << "Expected exponent notation to parse\n";
        return 1;
    }
    if (validation::parse_number(RawNumber{std::string{"+5"}}).has_value()) {
        std::cerr << "Expected a leading '+' to be rejected\n";
        return 1;
    }
    if (validation::parse_number(RawNumber{-2.5}) != std::optional<double>{-2.5}) {
        std::cerr << "Expected a finite negative number to pass through parse_number\n";
        return 1;
    }

    return 0;
}
