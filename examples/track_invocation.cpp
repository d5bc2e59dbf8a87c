// track_invocation.cpp
//
// Demonstrates classifying a command line and handing the result to the
// usage-telemetry client. Run it with any arguments, e.g.
//
//   ./track_invocation compose up -d --build web
//   ./track_invocation context create aci mycontext --location eastus
//
// The signature is printed locally; delivery to the CLI socket is
// fire-and-forget and silently gives up when nothing listens there.
// An unusable COMPOSE_TRACK_SOCKET turns telemetry off instead of failing.
//
// Compile: g++ -std=c++11 -I include examples/track_invocation.cpp -o track_invocation -pthread

#include "compose_track.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    // Diagnostics go to stderr at DEBUG so failed deliveries are visible.
    ctrack::Log::init(std::make_shared<ctrack::Logger>(ctrack::LogLevel::DEBUG));

    ctrack::TelemetryConfig config;
    config.applyEnvironment();

    std::pair<std::string, std::vector<std::string> > split = ctrack::splitArgv(argc, argv);

    // --- Example 1: Classification only ---
    {
        ctrack::CommandClassifier classifier(config.commandSet);
        std::cout << "signature: \"" << classifier.classify(split.second) << "\"" << std::endl;
        std::cout << "quiet:     " << (ctrack::hasQuietFlag(split.second) ? "yes" : "no") << std::endl;
    }

    // --- Example 2: Full tracking path ---
    {
        ctrack::Tracker tracker = ctrack::makeTracker(config, split.first);
        if (tracker.isInvokedAsCliBackend()) {
            std::cout << "invoked as backend, nothing sent" << std::endl;
        }
        tracker.track("default", split.second, ctrack::status::Success);
    }

    // Exit is not held up by the detached sender. It keeps its own
    // reference to the logger, so a late diagnostic is still safe.
    ctrack::Log::shutdown();
    return 0;
}
