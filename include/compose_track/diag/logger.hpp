#ifndef COMPOSE_TRACK_LOGGER_HPP
#define COMPOSE_TRACK_LOGGER_HPP

#include "../core/common.hpp"
#include "log_entry.hpp"
#include "sink_interface.hpp"
#include "console_sink.hpp"
#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>
#include <memory>

namespace ctrack {

    /// Diagnostic logger used by the library to report its own decisions.
    ///
    /// Message templates use named placeholders that are filled positionally:
    /// @code
    ///   Logger log(LogLevel::DEBUG);
    ///   log.debug("telemetry for {command} sent in {ms}ms", "up", 3);
    /// @endcode
    /// `{{` and `}}` produce literal braces.
    ///
    /// Entries are dispatched synchronously on the calling thread; sinks are
    /// serialized by an internal mutex, so a logger may be shared with the
    /// telemetry worker thread.
    class Logger {
    public:
        explicit Logger(LogLevel minLevel = LogLevel::INFO, bool addDefaultConsoleSink = true)
            : m_minLevel(minLevel) {
            if (addDefaultConsoleSink) {
                addSink<ConsoleSink>();
            }
        }

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void setMinLevel(LogLevel level) {
            m_minLevel.store(level, std::memory_order_relaxed);
        }

        LogLevel getMinLevel() const {
            return m_minLevel.load(std::memory_order_relaxed);
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args &&... args) {
            addCustomSink(detail::make_unique<SinkType>(std::forward<Args>(args)...));
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value && std::is_base_of<IFormatter,
                                    FormatterType>::value>::type
        addSink(Args &&... args) {
            auto sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<FormatterType>());
            addCustomSink(std::move(sink));
        }

        void addCustomSink(std::unique_ptr<ISink> sink) {
            std::lock_guard<std::mutex> lock(m_sinkMutex);
            m_sinks.push_back(std::move(sink));
        }

        template<typename... Args>
        void log(LogLevel level, const std::string &messageTemplate, const Args &... args) {
            if (level < getMinLevel()) return;

            LogEntry entry;
            entry.level = level;
            entry.timestamp = std::chrono::system_clock::now();
            entry.templateStr = messageTemplate;
            entry.message = formatMessage(messageTemplate, args...);
            entry.arguments = mapArgumentsToPlaceholders(messageTemplate, args...);

            std::lock_guard<std::mutex> lock(m_sinkMutex);
            for (const auto &sink: m_sinks) {
                sink->write(entry);
            }
        }

        template<typename... Args>
        void trace(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::TRACE, messageTemplate, args...);
        }

        template<typename... Args>
        void debug(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::DEBUG, messageTemplate, args...);
        }

        template<typename... Args>
        void info(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::INFO, messageTemplate, args...);
        }

        template<typename... Args>
        void warn(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::WARN, messageTemplate, args...);
        }

        template<typename... Args>
        void error(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::ERROR, messageTemplate, args...);
        }

        template<typename... Args>
        void fatal(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::FATAL, messageTemplate, args...);
        }

        template<typename... Args>
        static std::string formatMessage(const std::string &messageTemplate, const Args &... args) {
            std::vector<std::string> values{toString(args)...};
            std::string result;
            result.reserve(messageTemplate.length());
            size_t valueIndex = 0;

            for (size_t i = 0; i < messageTemplate.length(); ++i) {
                if (messageTemplate[i] == '{') {
                    if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '{') {
                        result += '{';
                        ++i;
                    } else {
                        size_t endPos = messageTemplate.find('}', i);
                        if (endPos == std::string::npos) {
                            result += messageTemplate[i];
                        } else if (valueIndex < values.size()) {
                            result += values[valueIndex++];
                            i = endPos;
                        } else {
                            result += messageTemplate.substr(i, endPos - i + 1);
                            i = endPos;
                        }
                    }
                } else if (messageTemplate[i] == '}') {
                    if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '}') {
                        result += '}';
                        ++i;
                    } else {
                        result += messageTemplate[i];
                    }
                } else {
                    result += messageTemplate[i];
                }
            }
            return result;
        }

    private:
        std::atomic<LogLevel> m_minLevel;
        std::mutex m_sinkMutex;
        std::vector<std::unique_ptr<ISink> > m_sinks;

        template<typename T>
        static std::string toString(const T &value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        // Pairs each named placeholder with its value, in template order.
        // Escaped braces are skipped and "{}" consumes a value without a name.
        template<typename... Args>
        static std::vector<std::pair<std::string, std::string> > mapArgumentsToPlaceholders(
            const std::string &messageTemplate, const Args &... args) {
            std::vector<std::pair<std::string, std::string> > argumentPairs;
            std::vector<std::string> values{toString(args)...};

            size_t valueIndex = 0;
            size_t i = 0;
            while (i < messageTemplate.length() && valueIndex < values.size()) {
                char c = messageTemplate[i];
                if ((c == '{' || c == '}') && i + 1 < messageTemplate.length() && messageTemplate[i + 1] == c) {
                    i += 2;
                    continue;
                }
                if (c != '{') {
                    ++i;
                    continue;
                }
                size_t endPos = messageTemplate.find('}', i);
                if (endPos == std::string::npos) break;
                std::string name = messageTemplate.substr(i + 1, endPos - i - 1);
                if (!name.empty()) {
                    argumentPairs.emplace_back(name, values[valueIndex]);
                }
                ++valueIndex;
                i = endPos + 1;
            }

            return argumentPairs;
        }
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_LOGGER_HPP
