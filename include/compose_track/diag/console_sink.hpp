#ifndef COMPOSE_TRACK_CONSOLE_SINK_HPP
#define COMPOSE_TRACK_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "human_readable_formatter.hpp"
#include "stream_transport.hpp"

namespace ctrack {
    /// Diagnostics default to stderr so they never mix with command output.
    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(ConsoleStream stream = ConsoleStream::StdErr) {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<ConsoleTransport>(stream));
        }

        void write(const LogEntry &entry) override {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(entry));
            }
        }
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_CONSOLE_SINK_HPP
