// service_logs.cpp
//
// Demonstrates the logs operation: a backend streams lines from several
// services and only the selected ones reach the terminal printer.
//
//   ./service_logs            # all services
//   ./service_logs web db     # only web and db
//
// Compile: g++ -std=c++11 -I include examples/service_logs.cpp -o service_logs -pthread

#include "compose_track.hpp"
#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    auto backend = std::make_shared<ctrack::ReplayLogBackend>();
    backend->append("shop", "web", "GET / 200");
    backend->append("shop", "db", "database system is ready to accept connections");
    backend->append("shop", "cache", "Ready to accept connections tcp");
    backend->append("shop", "web", "GET /cart 200");

    ctrack::LogOptions options;
    for (int i = 1; i < argc; ++i) {
        options.services.push_back(argv[i]);
    }

    ctrack::LogsService service(backend);
    auto printer = std::make_shared<ctrack::PrefixedLogConsumer>(nullptr, 5, true);

    // --- Example 1: Replay what is there ---
    {
        ctrack::CancellationToken token;
        service.logs(token, "shop", printer, options);
    }

    // --- Example 2: Follow, then cancel from another thread ---
    {
        ctrack::CancellationToken token;
        options.setFollow(true);

        std::thread producer([&] {
            backend->append("shop", "web", "POST /checkout 201");
            backend->append("shop", "db", "checkpoint complete");
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            token.cancel();
        });

        service.logs(token, "shop", printer, options);
        producer.join();
    }

    // --- Example 3: Unknown project ---
    try {
        ctrack::CancellationToken token;
        service.logs(token, "missing", printer, ctrack::LogOptions());
    } catch (const ctrack::ProjectNotFoundError& e) {
        std::cerr << "error: " << e.what() << std::endl;
    }

    return 0;
}
