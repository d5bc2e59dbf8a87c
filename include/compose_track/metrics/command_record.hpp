#ifndef COMPOSE_TRACK_COMMAND_RECORD_HPP
#define COMPOSE_TRACK_COMMAND_RECORD_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace ctrack {

    /// Where an invocation originated.
    enum class Source {
        CLI,
        API
    };

    inline const char* getSourceString(Source source) {
        switch (source) {
            case Source::CLI: return "cli";
            case Source::API: return "api";
            default: return "unknown";
        }
    }

    /// Outcome strings reported in Command::status.
    namespace status {
        static const char* const Success  = "success";
        static const char* const Failure  = "failure";
        static const char* const Canceled = "canceled";
    } // namespace status

    /// One classified invocation, handed to an IClient for delivery.
    struct Command {
        std::string command;
        std::string context;
        Source source;
        std::string status;

        Command() : source(Source::CLI) {}
        Command(std::string command_, std::string context_, Source source_, std::string status_)
            : command(std::move(command_))
            , context(std::move(context_))
            , source(source_)
            , status(std::move(status_)) {}
    };

    inline nlohmann::ordered_json toJson(const Command& cmd) {
        nlohmann::ordered_json j;
        j["command"] = cmd.command;
        j["context"] = cmd.context;
        j["source"] = getSourceString(cmd.source);
        j["status"] = cmd.status;
        return j;
    }

} // namespace ctrack

#endif // COMPOSE_TRACK_COMMAND_RECORD_HPP
