#include "readiness_prober.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sidecar {

namespace {

constexpr int kMaxBackoffExponent = 3;

/**
 * 非阻塞 connect + poll，超时或任何错误都返回 false
 */
bool try_connect(const addrinfo* addr, std::chrono::milliseconds timeout) {
    int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0) {
        return false;
    }
    fcntl(fd, F_SETFD, FD_CLOEXEC);

    bool connected = false;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0) {
        int rc = connect(fd, addr->ai_addr, addr->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int ret;
            do {
                ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
            } while (ret < 0 && errno == EINTR);

            if (ret > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                    connected = true;
                }
            }
        }
    }

    close(fd);
    return connected;
}

} // anonymous namespace

ReadinessProber::ReadinessProber(Endpoint endpoint,
                                 std::chrono::milliseconds connect_timeout,
                                 std::chrono::milliseconds backoff_unit,
                                 Sleeper sleeper)
    : endpoint_(std::move(endpoint)),
      connect_timeout_(connect_timeout),
      backoff_unit_(backoff_unit),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

bool ReadinessProber::is_reachable() const {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo* results = nullptr;
    const std::string port = std::to_string(endpoint_.port);
    if (getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &results) != 0) {
        return false;
    }

    bool reachable = false;
    for (const addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        if (try_connect(addr, connect_timeout_)) {
            reachable = true;
            break;
        }
    }
    freeaddrinfo(results);
    return reachable;
}

bool ReadinessProber::wait_until_ready(int max_attempts) const {
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        if (is_reachable()) {
            return true;
        }
        if (attempt + 1 < max_attempts) {
            sleeper_(backoff_delay(attempt, backoff_unit_));
        }
    }
    return false;
}

std::chrono::milliseconds ReadinessProber::backoff_delay(int attempt, std::chrono::milliseconds unit) {
    const int exponent = std::clamp(attempt, 0, kMaxBackoffExponent);
    return unit * (1 << exponent);
}

} // namespace sidecar
