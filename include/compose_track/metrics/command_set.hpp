#ifndef COMPOSE_TRACK_COMMAND_SET_HPP
#define COMPOSE_TRACK_COMMAND_SET_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ctrack {

    /// The immutable vocabulary the command classifier matches against.
    ///
    /// - commands: top-level command names (`up`, `ps`, `create`, ...)
    /// - managementCommands: names that open a subcommand group
    ///   (`compose`, `context`, `volume`, ...)
    /// - commandFlags: flags that are telemetry-relevant on their own
    ///   (`--version`, ...)
    ///
    /// A set is built once at startup and shared read-only, usually as a
    /// `std::shared_ptr<const CommandSet>`.
    class CommandSet {
    public:
        CommandSet(std::vector<std::string> commands,
                   std::vector<std::string> managementCommands,
                   std::vector<std::string> commandFlags)
            : m_commands(commands.begin(), commands.end())
            , m_managementCommands(managementCommands.begin(), managementCommands.end())
            , m_commandFlags(commandFlags.begin(), commandFlags.end()) {}

        /// True for any recognised command, management commands included.
        bool isCommand(const std::string& word) const {
            return m_commands.count(word) > 0 || isManagementCommand(word);
        }

        bool isManagementCommand(const std::string& word) const {
            return m_managementCommands.count(word) > 0;
        }

        bool isCommandFlag(const std::string& word) const {
            return m_commandFlags.count(word) > 0;
        }

        const std::set<std::string>& commands() const { return m_commands; }
        const std::set<std::string>& managementCommands() const { return m_managementCommands; }
        const std::set<std::string>& commandFlags() const { return m_commandFlags; }

        /// Docker CLI vocabulary, including the compose and cloud-context
        /// commands.
        static std::shared_ptr<const CommandSet> defaults() {
            static const std::shared_ptr<const CommandSet> s_defaults =
                std::make_shared<CommandSet>(
                    std::vector<std::string>{
                        "attach", "build", "commit", "convert", "cp", "create", "deploy",
                        "diff", "down", "events", "exec", "export", "history", "images",
                        "import", "info", "inspect", "kill", "load", "logs", "ls", "pause",
                        "port", "ps", "pull", "push", "rename", "restart", "rm", "rmi",
                        "run", "save", "search", "show", "start", "stats", "stop", "tag",
                        "top", "unpause", "up", "update", "use", "version", "wait",
                        "serve", "prune", "remove", "scale", "completion"
                    },
                    std::vector<std::string>{
                        "ecs", "aci", "assemble", "registry", "template", "cluster", "scan",
                        "app", "builder", "buildx", "imagetools", "checkpoint", "config",
                        "container", "context", "image", "manifest", "network", "node",
                        "plugin", "secret", "service", "stack", "swarm", "system", "trust",
                        "volume", "compose", "login", "logout", "azure"
                    },
                    std::vector<std::string>{
                        "--version", "--login"
                    });
            return s_defaults;
        }

    private:
        std::set<std::string> m_commands;
        std::set<std::string> m_managementCommands;
        std::set<std::string> m_commandFlags;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_COMMAND_SET_HPP
