#ifndef COMPOSE_TRACK_TELEMETRY_CONFIG_HPP
#define COMPOSE_TRACK_TELEMETRY_CONFIG_HPP

#include "metrics/command_set.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctrack {

    /// Raised for unreadable or malformed configuration.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
    };

    /// Telemetry settings.
    ///
    /// Defaults target the local desktop usage socket. Every setter returns
    /// `*this`:
    /// @code
    ///   TelemetryConfig cfg;
    ///   cfg.setSocketPath("/tmp/usage.sock").setTimeoutMs(100);
    /// @endcode
    ///
    /// JSON form (all keys optional, unknown keys ignored):
    /// @code
    ///   {
    ///     "enabled": true,
    ///     "socketPath": "/var/run/docker-cli.sock",
    ///     "endpoint": "/usage",
    ///     "timeoutMs": 50,
    ///     "backendSuffix": "-backend",
    ///     "commands": ["up", "down"],
    ///     "managementCommands": ["compose"],
    ///     "commandFlags": ["--version"]
    ///   }
    /// @endcode
    /// If any of the three vocabulary keys is present, the vocabulary is
    /// replaced as a whole; absent lists are empty.
    struct TelemetryConfig {
        bool enabled;
        std::string socketPath;
        std::string endpoint;
        size_t timeoutMs;
        std::string backendSuffix;
        std::shared_ptr<const CommandSet> commandSet;

        TelemetryConfig()
            : enabled(true)
            , socketPath("/var/run/docker-cli.sock")
            , endpoint("/usage")
            , timeoutMs(50)
            , backendSuffix("-backend")
            , commandSet(CommandSet::defaults()) {}

        TelemetryConfig& setEnabled(bool v) {
            enabled = v;
            return *this;
        }
        TelemetryConfig& setSocketPath(const std::string& path) {
            socketPath = path;
            return *this;
        }
        TelemetryConfig& setEndpoint(const std::string& ep) {
            endpoint = ep;
            return *this;
        }
        TelemetryConfig& setTimeoutMs(size_t ms) {
            timeoutMs = ms;
            return *this;
        }
        TelemetryConfig& setBackendSuffix(const std::string& suffix) {
            backendSuffix = suffix;
            return *this;
        }
        TelemetryConfig& setCommandSet(std::shared_ptr<const CommandSet> set) {
            commandSet = std::move(set);
            return *this;
        }

        /// Apply environment overrides:
        ///   COMPOSE_TRACK_SOCKET   replaces socketPath (when non-empty)
        ///   COMPOSE_TRACK_DISABLE  disables telemetry (when non-empty)
        TelemetryConfig& applyEnvironment() {
            const char* socket = std::getenv("COMPOSE_TRACK_SOCKET");
            if (socket && socket[0] != '\0') {
                socketPath = socket;
            }
            const char* disable = std::getenv("COMPOSE_TRACK_DISABLE");
            if (disable && disable[0] != '\0') {
                enabled = false;
            }
            return *this;
        }

        /// @throws ConfigError on type mismatches or a non-object document.
        static TelemetryConfig fromJson(const nlohmann::json& j) {
            if (!j.is_object()) {
                throw ConfigError("telemetry config: expected a JSON object");
            }
            TelemetryConfig cfg;
            try {
                if (j.contains("enabled")) cfg.enabled = j.at("enabled").get<bool>();
                if (j.contains("socketPath")) cfg.socketPath = j.at("socketPath").get<std::string>();
                if (j.contains("endpoint")) cfg.endpoint = j.at("endpoint").get<std::string>();
                if (j.contains("timeoutMs")) {
                    const nlohmann::json& timeout = j.at("timeoutMs");
                    if (!timeout.is_number_integer() || timeout.get<long long>() < 0) {
                        throw ConfigError("telemetry config: timeoutMs must be a non-negative integer");
                    }
                    cfg.timeoutMs = static_cast<size_t>(timeout.get<long long>());
                }
                if (j.contains("backendSuffix")) cfg.backendSuffix = j.at("backendSuffix").get<std::string>();

                if (j.contains("commands") || j.contains("managementCommands") || j.contains("commandFlags")) {
                    cfg.commandSet = std::make_shared<CommandSet>(
                        readList(j, "commands"),
                        readList(j, "managementCommands"),
                        readList(j, "commandFlags"));
                }
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError(std::string("telemetry config: ") + e.what());
            }
            if (cfg.endpoint.empty() || cfg.endpoint[0] != '/') {
                throw ConfigError("telemetry config: endpoint must start with '/': " + cfg.endpoint);
            }
            return cfg;
        }

        /// @throws ConfigError if the file cannot be opened or parsed.
        static TelemetryConfig loadFile(const std::string& path) {
            std::ifstream in(path);
            if (!in.is_open()) {
                throw ConfigError("telemetry config: cannot open " + path);
            }
            nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
            if (j.is_discarded()) {
                throw ConfigError("telemetry config: invalid JSON in " + path);
            }
            return fromJson(j);
        }

    private:
        static std::vector<std::string> readList(const nlohmann::json& j, const char* key) {
            if (!j.contains(key)) {
                return std::vector<std::string>();
            }
            return j.at(key).get<std::vector<std::string> >();
        }
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_TELEMETRY_CONFIG_HPP
