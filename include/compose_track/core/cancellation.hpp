#ifndef COMPOSE_TRACK_CANCELLATION_HPP
#define COMPOSE_TRACK_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace ctrack {

    /// Cooperative cancellation flag shared between the caller of a
    /// long-running operation and the code servicing it.
    ///
    /// Copies share state, so a token handed to a backend observes a
    /// cancel() issued through any other copy. Backends poll the flag; it
    /// does not wake a blocked backend.
    ///
    /// @code
    ///   CancellationToken token;
    ///   std::thread t([&] { service.logs(token, "demo", consumer, opts); });
    ///   ...
    ///   token.cancel();   // logs() returns normally
    ///   t.join();
    /// @endcode
    class CancellationToken {
    public:
        CancellationToken() : m_cancelled(std::make_shared<std::atomic<bool> >(false)) {}

        void cancel() {
            m_cancelled->store(true, std::memory_order_release);
        }

        bool isCancelled() const {
            return m_cancelled->load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<std::atomic<bool> > m_cancelled;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_CANCELLATION_HPP
