#ifndef COMPOSE_TRACK_SINK_INTERFACE_HPP
#define COMPOSE_TRACK_SINK_INTERFACE_HPP

#include "log_entry.hpp"
#include "formatter_interface.hpp"
#include "transport_interface.hpp"
#include <memory>

namespace ctrack {
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogEntry &entry) = 0;

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        IFormatter* formatter() const { return m_formatter.get(); }
        ITransport* transport() const { return m_transport.get(); }

    protected:
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_SINK_INTERFACE_HPP
