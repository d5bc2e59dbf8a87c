#ifndef COMPOSE_TRACK_LOG_CONSUMER_HPP
#define COMPOSE_TRACK_LOG_CONSUMER_HPP

#include <string>

namespace ctrack {

    /// Receives one log line attributed to the service that produced it.
    class ILogConsumer {
    public:
        virtual ~ILogConsumer() = default;
        virtual void log(const std::string& service, const std::string& line) = 0;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_LOG_CONSUMER_HPP
