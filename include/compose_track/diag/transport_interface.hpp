#ifndef COMPOSE_TRACK_TRANSPORT_INTERFACE_HPP
#define COMPOSE_TRACK_TRANSPORT_INTERFACE_HPP

#include <string>

namespace ctrack {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_TRANSPORT_INTERFACE_HPP
