#ifndef COMPOSE_TRACK_LOGS_SERVICE_HPP
#define COMPOSE_TRACK_LOGS_SERVICE_HPP

#include "log_backend.hpp"
#include "log_consumer.hpp"
#include "filtered_log_consumer.hpp"
#include "../diag/global.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctrack {

    struct LogOptions {
        std::vector<std::string> services;  ///< empty means all services
        bool follow;

        LogOptions() : follow(false) {}

        LogOptions& setServices(const std::vector<std::string>& s) {
            services = s;
            return *this;
        }
        LogOptions& setFollow(bool f) {
            follow = f;
            return *this;
        }
    };

    /// The `logs` operation: routes a backend's stream into a consumer,
    /// narrowing it to the requested services first.
    ///
    /// The backend always produces the full project stream; filtering
    /// happens at the consumer boundary. Backend exceptions propagate to the
    /// caller unchanged. Cancelling `token` ends a follow-mode call
    /// normally.
    class LogsService {
    public:
        explicit LogsService(std::shared_ptr<ILogBackend> backend)
            : m_backend(std::move(backend)) {
            if (!m_backend) {
                throw std::invalid_argument("LogsService: backend is null");
            }
        }

        void logs(const CancellationToken& token, const std::string& projectName,
                  std::shared_ptr<ILogConsumer> consumer, const LogOptions& options) {
            if (!consumer) {
                throw std::invalid_argument("LogsService: consumer is null");
            }
            if (!options.services.empty()) {
                Log::debug("filtering logs of {project} to {count} service(s)",
                           projectName, options.services.size());
                consumer = filterLogConsumer(std::move(consumer), options.services);
            }
            ILogConsumer* target = consumer.get();
            m_backend->getLogs(token, projectName,
                               [target](const std::string& service, const std::string& line) {
                                   target->log(service, line);
                               },
                               options.follow);
        }

    private:
        std::shared_ptr<ILogBackend> m_backend;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_LOGS_SERVICE_HPP
