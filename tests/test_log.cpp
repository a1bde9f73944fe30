#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "common/Log.hpp"

namespace {

// Redirects std::cout and std::cerr for the lifetime of the guard.
struct CaptureGuard {
    CaptureGuard() : previousOut(std::cout.rdbuf(out.rdbuf())), previousErr(std::cerr.rdbuf(err.rdbuf())) {}

    ~CaptureGuard() {
        std::cout.rdbuf(previousOut);
        std::cerr.rdbuf(previousErr);
    }

    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* previousOut;
    std::streambuf* previousErr;
};

bool contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
}

}  // namespace

int main() {
    const auto originalLevel = tvh::log::getLevel();
    std::string out;
    std::string err;
    std::string otherThreadContext = "unset";
    {
        CaptureGuard capture;
        tvh::log::setLevel(tvh::log::Level::Info);

        LOG_INFO("plain line");
        {
            tvh::log::ScopedContext route("POST /webhook");
            LOG_INFO("routed line");
            {
                tvh::log::ScopedContext symbol("symbol=AAPL");
                LOG_WARN("nested line");
            }
            LOG_INFO("after nested");

            std::thread other([&otherThreadContext]() { otherThreadContext = tvh::log::currentContext(); });
            other.join();
        }
        LOG_INFO("context released");
        LOG_DEBUG("filtered line");

        out = capture.out.str();
        err = capture.err.str();
    }
    tvh::log::setLevel(originalLevel);

    if (!contains(out, "[INFO] [thread ") || !contains(out, "] plain line\n")) {
        std::cerr << "Expected a plain INFO line on stdout, got:\n" << out;
        return 1;
    }
    if (contains(out, "] [] plain line")) {
        std::cerr << "Expected no context brackets without a context\n";
        return 1;
    }
    if (!contains(out, "[POST /webhook] routed line") || !contains(out, "[POST /webhook] after nested")) {
        std::cerr << "Expected the route context on routed lines, got:\n" << out;
        return 1;
    }
    if (!contains(err, "[WARN]") || !contains(err, "[POST /webhook symbol=AAPL] nested line")) {
        std::cerr << "Expected a nested context on the WARN line in stderr, got:\n" << err;
        return 1;
    }
    if (contains(out, "[POST /webhook] context released")) {
        std::cerr << "Expected the context to end with its scope\n";
        return 1;
    }
    if (!contains(out, "] context released")) {
        std::cerr << "Expected the line after the scope to be logged\n";
        return 1;
    }
    if (contains(out, "filtered line")) {
        std::cerr << "Expected DEBUG to be filtered at INFO level\n";
        return 1;
    }
    if (!otherThreadContext.empty()) {
        std::cerr << "Expected contexts to be per thread, got '" << otherThreadContext << "'\n";
        return 1;
    }
    if (!tvh::log::currentContext().empty()) {
        std::cerr << "Expected an empty context after all scopes ended\n";
        return 1;
    }

    if (tvh::log::levelFromString("WARNING") != tvh::log::Level::Warn ||
        tvh::log::levelFromString("err") != tvh::log::Level::Error) {
        std::cerr << "Unexpected level parsing\n";
        return 1;
    }
    try {
        tvh::log::levelFromString("verbose");
        std::cerr << "Expected an unknown level to throw\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    return 0;
}
