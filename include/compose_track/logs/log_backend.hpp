#ifndef COMPOSE_TRACK_LOG_BACKEND_HPP
#define COMPOSE_TRACK_LOG_BACKEND_HPP

#include "../core/cancellation.hpp"
#include <functional>
#include <stdexcept>
#include <string>

namespace ctrack {

    /// Raised by a log backend when retrieval fails.
    class LogsError : public std::runtime_error {
    public:
        explicit LogsError(const std::string& what) : std::runtime_error(what) {}
    };

    class ProjectNotFoundError : public LogsError {
    public:
        explicit ProjectNotFoundError(const std::string& project)
            : LogsError("project not found: " + project)
            , m_project(project) {}

        const std::string& project() const { return m_project; }

    private:
        std::string m_project;
    };

    /// Called once per (service, line) in delivery order.
    using LogEmitFn = std::function<void(const std::string&, const std::string&)>;

    /// A source of multiplexed per-service log lines for a project.
    class ILogBackend {
    public:
        virtual ~ILogBackend() = default;

        /// Emit every line of `projectName`. With `follow`, keep emitting new
        /// lines until `token` is cancelled, then return normally.
        /// @throws LogsError (or a subclass) when retrieval fails.
        virtual void getLogs(const CancellationToken& token, const std::string& projectName,
                             const LogEmitFn& emit, bool follow) = 0;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_LOG_BACKEND_HPP
