#ifndef COMPOSE_TRACK_UNIX_SOCKET_TRANSPORT_HPP
#define COMPOSE_TRACK_UNIX_SOCKET_TRANSPORT_HPP

#include "usage_transport.hpp"
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/time.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <time.h>

#ifdef MSG_NOSIGNAL
#define COMPOSE_TRACK_MSG_NOSIGNAL MSG_NOSIGNAL
#else
#define COMPOSE_TRACK_MSG_NOSIGNAL 0
#endif
#endif

namespace ctrack {

    /// Posts usage records as HTTP/1.1 requests over a local Unix domain
    /// socket, the way the desktop usage endpoint expects them:
    ///
    ///   POST /usage HTTP/1.1
    ///   Host: localhost
    ///   Content-Type: application/json
    ///
    /// Connect, send and the status-line read share one absolute deadline of
    /// `timeoutMs`, so a missing or wedged listener costs at most that long.
    /// Any 2xx status counts as delivered.
    class UnixSocketTransport : public IUsageTransport {
    public:
        UnixSocketTransport(std::string socketPath, std::string endpoint = "/usage",
                            size_t timeoutMs = 50)
            : m_socketPath(std::move(socketPath))
            , m_endpoint(std::move(endpoint))
            , m_timeoutMs(timeoutMs) {
#ifndef _WIN32
            if (m_socketPath.empty() || m_socketPath.size() >= sizeof(sockaddr_un().sun_path)) {
                throw std::invalid_argument("UnixSocketTransport: invalid socket path: " + m_socketPath);
            }
#endif
            for (size_t i = 0; i < m_endpoint.size(); ++i) {
                unsigned char c = static_cast<unsigned char>(m_endpoint[i]);
                if (c <= 0x20 || c == 0x7F) {
                    throw std::invalid_argument("UnixSocketTransport: invalid endpoint: " + m_endpoint);
                }
            }
        }

        bool post(const std::string& body) override {
#ifdef _WIN32
            (void)body;
            return false;
#else
            return postPosix(body);
#endif
        }

        const std::string& socketPath() const { return m_socketPath; }
        const std::string& endpoint() const { return m_endpoint; }

        /// Build the raw request bytes. Public for testability.
        static std::string buildRequest(const std::string& endpoint, const std::string& body) {
            std::string request;
            request.reserve(body.size() + 128);
            request += "POST " + endpoint + " HTTP/1.1\r\n";
            request += "Host: localhost\r\n";
            request += "Content-Type: application/json\r\n";
            request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
            request += "Connection: close\r\n";
            request += "\r\n";
            request += body;
            return request;
        }

        /// Parse "HTTP/1.1 204 No Content" into 204; returns -1 when malformed.
        static long parseStatusCode(const std::string& statusLine) {
            size_t spacePos = statusLine.find(' ');
            if (spacePos == std::string::npos) return -1;
            const char* start = statusLine.c_str() + spacePos + 1;
            char* endPtr = nullptr;
            long code = std::strtol(start, &endPtr, 10);
            if (endPtr == start) return -1;
            return code;
        }

    private:
#ifndef _WIN32
        bool postPosix(const std::string& body) {
            struct timespec deadline;
            clock_gettime(CLOCK_MONOTONIC, &deadline);
            deadline.tv_sec += static_cast<time_t>(m_timeoutMs / 1000);
            deadline.tv_nsec += static_cast<long>((m_timeoutMs % 1000) * 1000000L);
            if (deadline.tv_nsec >= 1000000000L) {
                deadline.tv_sec += 1;
                deadline.tv_nsec -= 1000000000L;
            }

            auto remainingMs = [&]() -> long {
                struct timespec now;
                clock_gettime(CLOCK_MONOTONIC, &now);
                long ms = (deadline.tv_sec - now.tv_sec) * 1000L
                        + (deadline.tv_nsec - now.tv_nsec) / 1000000L;
                return ms > 0 ? ms : 0;
            };

            int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd < 0) return false;

            struct ScopedSocket {
                int fd;
                explicit ScopedSocket(int f) : fd(f) {}
                ~ScopedSocket() { if (fd >= 0) { ::close(fd); } }
                ScopedSocket(const ScopedSocket&) = delete;
                ScopedSocket& operator=(const ScopedSocket&) = delete;
            };
            ScopedSocket guard(fd);

#ifdef SO_NOSIGPIPE
            {
                int one = 1;
                setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
            }
#endif

            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

            struct sockaddr_un addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            std::memcpy(addr.sun_path, m_socketPath.c_str(), m_socketPath.size());

            if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
                if (errno != EINPROGRESS && errno != EAGAIN) {
                    return false;
                }
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int sel;
                do {
                    long rm = remainingMs();
                    if (rm <= 0) { sel = 0; break; }
                    sel = ::poll(&pfd, 1, static_cast<int>(rm > static_cast<long>(INT_MAX) ? INT_MAX : rm));
                } while (sel < 0 && errno == EINTR);
                if (sel <= 0) return false;

                int soError = 0;
                socklen_t len = sizeof(soError);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                    return false;
                }
            }

            if (fcntl(fd, F_SETFL, flags) < 0) return false;

            auto setSocketTimeout = [&](int optname) -> bool {
                long rm = remainingMs();
                if (rm <= 0) return false;
                struct timeval tv;
                tv.tv_sec = static_cast<long>(rm / 1000);
                tv.tv_usec = static_cast<long>((rm % 1000) * 1000);
                return setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv)) == 0;
            };

            std::string request = buildRequest(m_endpoint, body);
            size_t totalSent = 0;
            while (totalSent < request.size()) {
                if (!setSocketTimeout(SO_SNDTIMEO)) return false;
                ssize_t sent;
                do {
                    sent = ::send(fd, request.data() + totalSent, request.size() - totalSent,
                                  COMPOSE_TRACK_MSG_NOSIGNAL);
                } while (sent < 0 && errno == EINTR);
                if (sent <= 0) return false;
                totalSent += static_cast<size_t>(sent);
            }

            // Only the status line matters; accumulate until the first CRLF.
            std::string response;
            char buf[256];
            while (response.size() < 4096) {
                if (!setSocketTimeout(SO_RCVTIMEO)) break;
                ssize_t n;
                do { n = ::recv(fd, buf, sizeof(buf), 0); }
                while (n < 0 && errno == EINTR);
                if (n <= 0) break;
                response.append(buf, static_cast<size_t>(n));
                if (response.find("\r\n") != std::string::npos) break;
            }

            long code = parseStatusCode(response);
            return code >= 200 && code < 300;
        }
#endif

        std::string m_socketPath;
        std::string m_endpoint;
        size_t m_timeoutMs;
    };

} // namespace ctrack

#endif // COMPOSE_TRACK_UNIX_SOCKET_TRANSPORT_HPP
