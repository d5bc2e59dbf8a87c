#ifndef COMPOSE_TRACK_FORMATTER_INTERFACE_HPP
#define COMPOSE_TRACK_FORMATTER_INTERFACE_HPP

#include "log_entry.hpp"
#include <string>

namespace ctrack {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogEntry &entry) const = 0;
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_FORMATTER_INTERFACE_HPP
