#ifndef COMPOSE_TRACK_PREFIXED_LOG_CONSUMER_HPP
#define COMPOSE_TRACK_PREFIXED_LOG_CONSUMER_HPP

#include "log_consumer.hpp"
#include "../core/common.hpp"
#include "../diag/stream_transport.hpp"
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ctrack {

    /// Terminal-style consumer: writes `service | line`.
    ///
    /// Service names are left-aligned to `width` columns so that columns
    /// line up across services. When colour is on, each service gets the
    /// next colour of a fixed palette on first sight and keeps it.
    ///
    /// Colour is forced off when the `NO_COLOR` environment variable is set.
    class PrefixedLogConsumer : public ILogConsumer {
    public:
        explicit PrefixedLogConsumer(std::unique_ptr<ITransport> transport = nullptr,
                                     size_t width = 0, bool color = false)
            : m_transport(transport ? std::move(transport)
                                    : std::unique_ptr<ITransport>(detail::make_unique<ConsoleTransport>(ConsoleStream::StdOut)))
            , m_width(width)
            , m_color(color && std::getenv("NO_COLOR") == nullptr)
            , m_nextColor(0) {}

        void log(const std::string& service, const std::string& line) override {
            std::string out;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                out = formatLine(service, line);
            }
            m_transport->write(out);
        }

        bool isColorEnabled() const { return m_color; }

        /// Escape sequence for palette slot `index` (wraps around).
        static const char* paletteColor(size_t index) {
            static const char* const palette[] = {
                "\033[36m",   // cyan
                "\033[33m",   // yellow
                "\033[32m",   // green
                "\033[35m",   // magenta
                "\033[34m",   // blue
                "\033[1;36m", // bright cyan
                "\033[1;33m", // bright yellow
                "\033[1;32m", // bright green
                "\033[1;35m", // bright magenta
                "\033[1;34m"  // bright blue
            };
            return palette[index % (sizeof(palette) / sizeof(palette[0]))];
        }

    private:
        std::string formatLine(const std::string& service, const std::string& line) {
            std::string prefix = service;
            if (prefix.size() < m_width) {
                prefix.append(m_width - prefix.size(), ' ');
            }
            prefix += "  |";
            if (m_color) {
                prefix = colorFor(service) + prefix + "\033[0m";
            }
            return prefix + " " + line;
        }

        std::string colorFor(const std::string& service) {
            std::map<std::string, size_t>::const_iterator it = m_colors.find(service);
            if (it == m_colors.end()) {
                it = m_colors.insert(std::make_pair(service, m_nextColor++)).first;
            }
            return paletteColor(it->second);
        }

        std::unique_ptr<ITransport> m_transport;
        size_t m_width;
        bool m_color;
        std::mutex m_mutex;
        std::map<std::string, size_t> m_colors;
        size_t m_nextColor;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_PREFIXED_LOG_CONSUMER_HPP
