#ifndef COMPOSE_TRACK_USAGE_TRANSPORT_HPP
#define COMPOSE_TRACK_USAGE_TRANSPORT_HPP

#include <string>

namespace ctrack {

    /// Delivers one serialized usage record.
    class IUsageTransport {
    public:
        virtual ~IUsageTransport() = default;

        /// Returns true if the receiver acknowledged the record.
        virtual bool post(const std::string& body) = 0;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_USAGE_TRANSPORT_HPP
