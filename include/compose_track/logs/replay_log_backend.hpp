#ifndef COMPOSE_TRACK_REPLAY_LOG_BACKEND_HPP
#define COMPOSE_TRACK_REPLAY_LOG_BACKEND_HPP

#include "log_backend.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ctrack {

    /// In-memory log backend.
    ///
    /// Holds an ordered list of (service, line) entries per project.
    /// Without follow, getLogs() replays the current entries and returns.
    /// With follow, it replays and then keeps emitting entries appended by
    /// other threads until the token is cancelled. A cancel() is noticed
    /// within one poll interval.
    ///
    /// emit is always invoked without the internal lock held, so a consumer
    /// may call append() on the same backend.
    class ReplayLogBackend : public ILogBackend {
    public:
        explicit ReplayLogBackend(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20))
            : m_pollInterval(pollInterval) {}

        /// Create an empty project. Existing projects are left untouched.
        void addProject(const std::string& projectName) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_projects[projectName];
        }

        /// Append a line, creating the project if needed.
        void append(const std::string& projectName, const std::string& service, const std::string& line) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_projects[projectName].push_back(std::make_pair(service, line));
            }
            m_cv.notify_all();
        }

        void getLogs(const CancellationToken& token, const std::string& projectName,
                     const LogEmitFn& emit, bool follow) override {
            size_t next = 0;
            while (true) {
                std::vector<std::pair<std::string, std::string> > pending;
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    std::map<std::string, Entries>::const_iterator it = m_projects.find(projectName);
                    if (it == m_projects.end()) {
                        throw ProjectNotFoundError(projectName);
                    }
                    if (follow && next >= it->second.size()) {
                        m_cv.wait_for(lock, m_pollInterval);
                        it = m_projects.find(projectName);
                    }
                    pending.assign(it->second.begin() + static_cast<std::ptrdiff_t>(next), it->second.end());
                    next = it->second.size();
                }

                for (size_t i = 0; i < pending.size(); ++i) {
                    if (token.isCancelled()) return;
                    emit(pending[i].first, pending[i].second);
                }

                if (!follow || token.isCancelled()) return;
            }
        }

    private:
        typedef std::vector<std::pair<std::string, std::string> > Entries;

        std::chrono::milliseconds m_pollInterval;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::map<std::string, Entries> m_projects;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_REPLAY_LOG_BACKEND_HPP
