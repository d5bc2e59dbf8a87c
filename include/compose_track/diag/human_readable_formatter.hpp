#ifndef COMPOSE_TRACK_HUMAN_READABLE_FORMATTER_HPP
#define COMPOSE_TRACK_HUMAN_READABLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/common.hpp"
#include <sstream>

namespace ctrack {
    class HumanReadableFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            oss << detail::formatTimestamp(entry.timestamp) << " "
                << "[" << getLevelString(entry.level) << "] "
                << entry.message;
            return oss.str();
        }
    };
} // namespace ctrack

#endif // COMPOSE_TRACK_HUMAN_READABLE_FORMATTER_HPP
