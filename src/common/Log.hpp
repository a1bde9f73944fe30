#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

namespace tvh::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Tags every line this thread logs while it is alive, e.g. "POST /webhook symbol=AAPL".
// Nested contexts append to the enclosing one.
class ScopedContext {
public:
    explicit ScopedContext(std::string_view tag);
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

private:
    std::size_t previousSize_;
};

const std::string& currentContext() noexcept;

}  // namespace tvh::log

#define TVH_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::tvh::log::shouldLog(level)) {                                                \
            std::ostringstream tvh_log_stream__;                                           \
            tvh_log_stream__ << expr;                                                      \
            ::tvh::log::log(level, tvh_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) TVH_LOG_IMPL(::tvh::log::Level::Debug, expr)
#define LOG_INFO(expr) TVH_LOG_IMPL(::tvh::log::Level::Info, expr)
#define LOG_WARN(expr) TVH_LOG_IMPL(::tvh::log::Level::Warn, expr)
#define LOG_ERR(expr) TVH_LOG_IMPL(::tvh::log::Level::Error, expr)
