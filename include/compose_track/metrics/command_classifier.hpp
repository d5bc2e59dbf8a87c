#ifndef COMPOSE_TRACK_COMMAND_CLASSIFIER_HPP
#define COMPOSE_TRACK_COMMAND_CLASSIFIER_HPP

#include "command_set.hpp"
#include "../core/common.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctrack {

    /// Reduces an argument vector to the space-joined subsequence of tokens
    /// that are safe to report as a usage key.
    ///
    /// Rules, applied in one left-to-right pass:
    ///   - `--help` anywhere is moved to the front of the result.
    ///   - `--` ends the scan; nothing after it is looked at.
    ///   - a command flag is always kept.
    ///   - a command is kept until the first non-management command has been
    ///     seen; after that only command flags are kept.
    ///   - every other token is dropped.
    ///
    /// @code
    ///   CommandClassifier c(CommandSet::defaults());
    ///   c.classify({"compose", "up", "-d", "web"});      // "compose up"
    ///   c.classify({"context", "create", "ecs", "prod"}); // "context create"
    ///   c.classify({"up", "--help"});                     // "--help up"
    /// @endcode
    ///
    /// Flag arity is not modeled: the value of `--format json` is dropped
    /// only because `json` is not a command.
    class CommandClassifier {
    public:
        explicit CommandClassifier(std::shared_ptr<const CommandSet> commands)
            : m_commands(std::move(commands)) {
            if (!m_commands) {
                throw std::invalid_argument("CommandClassifier: command set is null");
            }
        }

        std::string classify(const std::vector<std::string>& args) const {
            std::string result;
            bool onlyFlags = false;
            for (size_t i = 0; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (arg == "--help") {
                    result = detail::trim(arg + " " + result);
                    continue;
                }
                if (arg == "--") {
                    break;
                }
                const bool isCommand = m_commands->isCommand(arg);
                if (m_commands->isCommandFlag(arg) || (!onlyFlags && isCommand)) {
                    result = detail::trim(result + " " + arg);
                    if (isCommand && !m_commands->isManagementCommand(arg)) {
                        onlyFlags = true;
                    }
                }
            }
            return detail::trim(result);
        }

        const CommandSet& commandSet() const { return *m_commands; }

    private:
        std::shared_ptr<const CommandSet> m_commands;
    };

    /// True if any argument is exactly `--quiet` or `-q`.
    inline bool hasQuietFlag(const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--quiet" || args[i] == "-q") {
                return true;
            }
        }
        return false;
    }

} // namespace ctrack

#endif // COMPOSE_TRACK_COMMAND_CLASSIFIER_HPP
