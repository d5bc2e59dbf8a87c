#ifndef COMPOSE_TRACK_STREAM_TRANSPORT_HPP
#define COMPOSE_TRACK_STREAM_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>
#include <ostream>

namespace ctrack {
    enum class ConsoleStream { StdOut, StdErr };

    /// Writes one flushed line per entry to stdout or stderr.
    ///
    /// Every transport on the same stream shares one lock, so lines from
    /// the log printer and from diagnostics never interleave mid-line.
    class ConsoleTransport : public ITransport {
    public:
        explicit ConsoleTransport(ConsoleStream stream = ConsoleStream::StdOut)
            : m_stream(stream) {}

        void write(const std::string &formattedEntry) override {
            std::ostream &out = m_stream == ConsoleStream::StdOut ? std::cout : std::cerr;
            std::lock_guard<std::mutex> lock(streamMutex(m_stream));
            out << formattedEntry << '\n' << std::flush;
        }

        ConsoleStream stream() const { return m_stream; }

    private:
        // Never destroyed; the telemetry worker may write during exit.
        static std::mutex &streamMutex(ConsoleStream stream) {
            static std::mutex *s_stdout = new std::mutex();
            static std::mutex *s_stderr = new std::mutex();
            return stream == ConsoleStream::StdOut ? *s_stdout : *s_stderr;
        }

        ConsoleStream m_stream;
    };

    /// Writes to a caller-owned stream. The stream must outlive the transport.
    class OStreamTransport : public ITransport {
    public:
        explicit OStreamTransport(std::ostream &out) : m_out(out) {}

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_out << formattedEntry << '\n';
            m_out.flush();
        }

    private:
        std::ostream &m_out;
        std::mutex m_mutex;
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_STREAM_TRANSPORT_HPP
