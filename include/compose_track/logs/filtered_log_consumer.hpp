#ifndef COMPOSE_TRACK_FILTERED_LOG_CONSUMER_HPP
#define COMPOSE_TRACK_FILTERED_LOG_CONSUMER_HPP

#include "log_consumer.hpp"
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctrack {

    /// Consumer decorator that forwards only lines from selected services.
    ///
    /// An empty service set forwards everything. Accepted lines are passed
    /// to the inner consumer synchronously and in arrival order; rejected
    /// lines are dropped without any diagnostic.
    ///
    /// @code
    ///   auto printer = std::make_shared<PrefixedLogConsumer>();
    ///   FilteredLogConsumer onlyWeb(printer, {"web"});
    ///   onlyWeb.log("web", "GET /");   // printed
    ///   onlyWeb.log("db", "ready");    // dropped
    /// @endcode
    class FilteredLogConsumer : public ILogConsumer {
    public:
        FilteredLogConsumer(std::shared_ptr<ILogConsumer> inner, std::set<std::string> services)
            : m_inner(std::move(inner))
            , m_services(std::move(services)) {
            if (!m_inner) {
                throw std::invalid_argument("FilteredLogConsumer: inner consumer is null");
            }
        }

        void log(const std::string& service, const std::string& line) override {
            if (accepts(service)) {
                m_inner->log(service, line);
            }
        }

        bool accepts(const std::string& service) const {
            return m_services.empty() || m_services.count(service) > 0;
        }

        const std::set<std::string>& services() const { return m_services; }

        ILogConsumer* inner() { return m_inner.get(); }
        const ILogConsumer* inner() const { return m_inner.get(); }

    private:
        std::shared_ptr<ILogConsumer> m_inner;
        std::set<std::string> m_services;
    };

    /// Wrap `consumer` so that only `services` reach it.
    inline std::shared_ptr<ILogConsumer> filterLogConsumer(std::shared_ptr<ILogConsumer> consumer,
                                                           const std::vector<std::string>& services) {
        return std::make_shared<FilteredLogConsumer>(
            std::move(consumer), std::set<std::string>(services.begin(), services.end()));
    }

} // namespace ctrack

#endif // COMPOSE_TRACK_FILTERED_LOG_CONSUMER_HPP
