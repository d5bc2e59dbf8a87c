#ifndef COMPOSE_TRACK_USAGE_CLIENT_HPP
#define COMPOSE_TRACK_USAGE_CLIENT_HPP

#include "command_record.hpp"
#include "usage_transport.hpp"
#include "../diag/global.hpp"
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace ctrack {

    /// Accepts finished usage records for delivery.
    ///
    /// Implementations must not throw from send() and must not block the
    /// caller on delivery.
    class IClient {
    public:
        virtual ~IClient() = default;
        virtual void send(const Command& command) = 0;
    };

    /// Discards every record. Used when telemetry is disabled.
    class NullClient : public IClient {
    public:
        void send(const Command&) override {}
    };

    /// Fire-and-forget client.
    ///
    /// Each send() serializes the record and hands it to a detached worker
    /// thread that posts it through the transport. send() returns as soon as
    /// the worker is started; there is no completion signal. The worker
    /// shares ownership of the transport, so the client may be destroyed
    /// while a post is still in flight, and a detached worker never delays
    /// process exit.
    ///
    /// Delivery failures, including exceptions thrown by a transport, are
    /// reported at DEBUG level to the logger installed in ctrack::Log when
    /// send() was called, and go no further. The worker holds that logger,
    /// so it stays usable even if the worker outlives main().
    class UsageClient : public IClient {
    public:
        explicit UsageClient(std::shared_ptr<IUsageTransport> transport)
            : m_transport(std::move(transport)) {
            if (!m_transport) {
                throw std::invalid_argument("UsageClient: transport is null");
            }
        }

        void send(const Command& command) override {
            std::string body = toJson(command).dump();
            std::shared_ptr<IUsageTransport> transport = m_transport;
            std::shared_ptr<Logger> logger = Log::current();
            std::string name = command.command;
            try {
                std::thread worker([transport, logger, body, name]() {
                    deliver(*transport, logger.get(), body, name);
                });
                worker.detach();
            } catch (const std::system_error& e) {
                Log::debug("usage record for {command} not sent: {error}", name, e.what());
            }
        }

    private:
        static void deliver(IUsageTransport& transport, Logger* logger, const std::string& body,
                            const std::string& name) {
            bool accepted = false;
            std::string error;
            try {
                accepted = transport.post(body);
            } catch (const std::exception& e) {
                error = e.what();
            }
            if (!logger) return;

            if (accepted) {
                logger->trace("usage record for {command} delivered", name);
            } else if (error.empty()) {
                logger->debug("usage record for {command} was not accepted", name);
            } else {
                logger->debug("usage record for {command} failed: {error}", name, error);
            }
        }

        std::shared_ptr<IUsageTransport> m_transport;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_USAGE_CLIENT_HPP
