#ifndef COMPOSE_TRACK_CALLBACK_SINK_HPP
#define COMPOSE_TRACK_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include <functional>

namespace ctrack {

    /// Hands every diagnostic entry to a host-provided callback, for hosts
    /// that route library diagnostics into their own logging.
    ///
    /// @note The callback runs on the logging thread, which for delivery
    ///       failures is the detached telemetry worker.
    class CallbackSink : public ISink {
    public:
        using EntryCallback = std::function<void(const LogEntry&)>;

        explicit CallbackSink(EntryCallback cb)
            : m_callback(std::move(cb)) {}

        void write(const LogEntry& entry) override {
            if (m_callback) {
                m_callback(entry);
            }
        }

    private:
        EntryCallback m_callback;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_CALLBACK_SINK_HPP
