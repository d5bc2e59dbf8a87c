#ifndef COMPOSE_TRACK_LOG_ENTRY_HPP
#define COMPOSE_TRACK_LOG_ENTRY_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace ctrack {
    /// Severity of a library diagnostic. Delivery failures use DEBUG and
    /// skipped telemetry uses TRACE; nothing the library reports is fatal.
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        static const char *const names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        size_t index = static_cast<size_t>(level);
        return index < sizeof(names) / sizeof(names[0]) ? names[index] : "UNKNOWN";
    }

    /// A diagnostic record emitted by the library itself.
    struct LogEntry {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string templateStr;
        std::vector<std::pair<std::string, std::string> > arguments;  ///< placeholder name, value
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_LOG_ENTRY_HPP
