#ifndef COMPOSE_TRACK_CALLBACK_LOG_CONSUMER_HPP
#define COMPOSE_TRACK_CALLBACK_LOG_CONSUMER_HPP

#include "log_consumer.hpp"
#include <functional>
#include <string>

namespace ctrack {

    /// Adapts a callable to ILogConsumer.
    class CallbackLogConsumer : public ILogConsumer {
    public:
        using Callback = std::function<void(const std::string&, const std::string&)>;

        explicit CallbackLogConsumer(Callback cb) : m_callback(std::move(cb)) {}

        void log(const std::string& service, const std::string& line) override {
            if (m_callback) {
                m_callback(service, line);
            }
        }

    private:
        Callback m_callback;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_CALLBACK_LOG_CONSUMER_HPP
