#ifndef COMPOSE_TRACK_TRACKER_HPP
#define COMPOSE_TRACK_TRACKER_HPP

#include "command_classifier.hpp"
#include "command_record.hpp"
#include "usage_client.hpp"
#include "unix_socket_transport.hpp"
#include "../core/common.hpp"
#include "../diag/global.hpp"
#include "../telemetry_config.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ctrack {

    /// Classifies invocations and hands non-empty results to a client.
    ///
    /// The tracker is skipped entirely when the process was started as the
    /// internal backend, recognised by its invocation name ending in the
    /// backend suffix (`-backend` by default). The check is a plain string
    /// suffix match on argv[0].
    ///
    /// @code
    ///   Tracker tracker(classifier, client, argv[0]);
    ///   tracker.track(currentContext, args, status::Success);
    /// @endcode
    class Tracker {
    public:
        Tracker(std::shared_ptr<const CommandClassifier> classifier,
                std::shared_ptr<IClient> client,
                std::string invocationName,
                std::string backendSuffix = "-backend")
            : m_classifier(std::move(classifier))
            , m_client(std::move(client))
            , m_invocationName(std::move(invocationName))
            , m_backendSuffix(std::move(backendSuffix)) {
            if (!m_classifier || !m_client) {
                throw std::invalid_argument("Tracker: classifier and client are required");
            }
        }

        bool isInvokedAsCliBackend() const {
            return detail::endsWith(m_invocationName, m_backendSuffix);
        }

        /// Classify `args` (argv without the program name) and send the
        /// result. Never throws on account of delivery.
        void track(const std::string& context, const std::vector<std::string>& args,
                   const std::string& status) const {
            if (isInvokedAsCliBackend()) {
                Log::trace("telemetry skipped: invoked as {name}", m_invocationName);
                return;
            }
            std::string command = m_classifier->classify(args);
            if (command.empty()) {
                return;
            }
            m_client->send(Command(command, context, Source::CLI, status));
        }

        const std::string& invocationName() const { return m_invocationName; }

    private:
        std::shared_ptr<const CommandClassifier> m_classifier;
        std::shared_ptr<IClient> m_client;
        std::string m_invocationName;
        std::string m_backendSuffix;
    };

    /// Split a C-style argument vector into (argv[0], argv[1..]).
    inline std::pair<std::string, std::vector<std::string> > splitArgv(int argc, const char* const* argv) {
        std::pair<std::string, std::vector<std::string> > result;
        if (argc <= 0 || argv == nullptr) {
            return result;
        }
        result.first = argv[0] ? argv[0] : "";
        for (int i = 1; i < argc; ++i) {
            result.second.push_back(argv[i] ? argv[i] : "");
        }
        return result;
    }

    /// Wire a tracker from configuration: a UsageClient over a
    /// UnixSocketTransport, or a NullClient when telemetry is disabled.
    ///
    /// Never throws on account of the socket settings: a path or endpoint
    /// the transport rejects disables telemetry with a DEBUG diagnostic.
    inline Tracker makeTracker(const TelemetryConfig& config, const std::string& invocationName) {
        std::shared_ptr<IClient> client;
        if (config.enabled) {
            try {
                client = std::make_shared<UsageClient>(
                    std::make_shared<UnixSocketTransport>(config.socketPath, config.endpoint, config.timeoutMs));
            } catch (const std::invalid_argument& e) {
                Log::debug("telemetry disabled: {error}", e.what());
            }
        }
        if (!client) {
            client = std::make_shared<NullClient>();
        }
        return Tracker(std::make_shared<CommandClassifier>(config.commandSet),
                       client, invocationName, config.backendSuffix);
    }

} // namespace ctrack

#endif // COMPOSE_TRACK_TRACKER_HPP
