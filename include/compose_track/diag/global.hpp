#ifndef COMPOSE_TRACK_GLOBAL_HPP
#define COMPOSE_TRACK_GLOBAL_HPP

#include "logger.hpp"
#include <memory>
#include <mutex>

namespace ctrack {

    /// Process-wide diagnostic logger facade.
    ///
    /// The library reports through this facade. Until an application calls
    /// init(), every logging call is a no-op, so embedding the library never
    /// produces output the host did not ask for.
    ///
    /// @code
    ///   auto logger = std::make_shared<ctrack::Logger>(ctrack::LogLevel::DEBUG);
    ///   ctrack::Log::init(logger);
    ///   ...
    ///   ctrack::Log::shutdown();
    /// @endcode
    ///
    /// Thread safety: the mutex is held only to copy the shared_ptr; the
    /// log call itself runs outside it.
    class Log {
    public:
        Log() = delete;

        static void init(std::shared_ptr<Logger> logger) {
            std::lock_guard<std::mutex> lock(mutex());
            storage().swap(logger);
        }

        static void shutdown() {
            std::shared_ptr<Logger> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                old = std::move(storage());
            }
        }

        static bool isInitialized() {
            std::lock_guard<std::mutex> lock(mutex());
            return storage() != nullptr;
        }

        /// The installed logger, or null before init() and after shutdown().
        static std::shared_ptr<Logger> current() {
            std::lock_guard<std::mutex> lock(mutex());
            return storage();
        }

        template<typename... Args>
        static void log(LogLevel level, const std::string& msg, const Args&... args) {
            std::shared_ptr<Logger> ptr = current();
            if (ptr) {
                ptr->log(level, msg, args...);
            }
        }

        template<typename... Args>
        static void trace(const std::string& msg, const Args&... args) {
            log(LogLevel::TRACE, msg, args...);
        }

        template<typename... Args>
        static void debug(const std::string& msg, const Args&... args) {
            log(LogLevel::DEBUG, msg, args...);
        }

        template<typename... Args>
        static void info(const std::string& msg, const Args&... args) {
            log(LogLevel::INFO, msg, args...);
        }

        template<typename... Args>
        static void warn(const std::string& msg, const Args&... args) {
            log(LogLevel::WARN, msg, args...);
        }

        template<typename... Args>
        static void error(const std::string& msg, const Args&... args) {
            log(LogLevel::ERROR, msg, args...);
        }

        template<typename... Args>
        static void fatal(const std::string& msg, const Args&... args) {
            log(LogLevel::FATAL, msg, args...);
        }

    private:
        // Both are leaked on purpose: detached telemetry workers may still
        // log while static destructors run at process exit.
        static std::mutex& mutex() {
            static std::mutex* s_mutex = new std::mutex();
            return *s_mutex;
        }

        static std::shared_ptr<Logger>& storage() {
            static std::shared_ptr<Logger>* s_logger = new std::shared_ptr<Logger>();
            return *s_logger;
        }
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_GLOBAL_HPP
