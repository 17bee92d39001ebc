#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace seisspec {
namespace log {

/// Log severity, in increasing order
enum class Level : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

/// Convert level to string
inline const char* toString(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF: return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Destination for formatted log messages.
 *
 * Receives the severity and the fully formatted message (no trailing
 * newline).
 */
using Sink = std::function<void(Level level, const std::string& message)>;

/**
 * @brief Process-wide leveled logger.
 *
 * Messages below the configured level are dropped before formatting.
 * The default sink writes to stderr; tests and host applications can
 * install their own.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Emit a preformatted message
    void log(Level level, const std::string& message);

    /// Check whether messages at this level are emitted
    [[nodiscard]] bool enabled(Level level) const;

    [[nodiscard]] Level level() const;
    void setLevel(Level level);

    /// Replace the sink; an empty function restores the stderr sink
    void setSink(Sink sink);

private:
    Logger();

    mutable std::mutex mutex_;
    Level level_ = Level::WARN;
    Sink sink_;
};

/// Set the process-wide log level
inline void setLevel(Level level) { Logger::instance().setLevel(level); }

/// Install a sink on the process-wide logger
inline void setSink(Sink sink) { Logger::instance().setSink(std::move(sink)); }

/// Format and emit a message if the level is enabled
template <typename... Args>
void logf(Level level, fmt::format_string<Args...> fmt_str, Args&&... args) {
    Logger& logger = Logger::instance();
    if (!logger.enabled(level)) {
        return;
    }
    logger.log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace log
} // namespace seisspec

#define SEISSPEC_LOG_DEBUG(...) ::seisspec::log::logf(::seisspec::log::Level::DEBUG, __VA_ARGS__)
#define SEISSPEC_LOG_ERROR(...) ::seisspec::log::logf(::seisspec::log::Level::ERROR, __VA_ARGS__)
