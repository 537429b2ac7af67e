#include "softmock/core/net/Stream.h"
#ifdef _WIN32
#include <winsock2.h>
#define poll WSAPoll
#else
#include <poll.h>
#include <cerrno>
#endif
#include <chrono>
#include <vector>

namespace softmock::core::net {
namespace {
#ifdef POLLRDHUP
constexpr short kHangup = POLLRDHUP | POLLHUP | POLLERR;
#else
constexpr short kHangup = POLLHUP | POLLERR;
#endif
}

WaitResult wait_readable(const Stream& s, int cancel_fd, int timeout_ms) {
    if (s.has_pending() || s.native() < 0) return WaitResult::ready;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        pollfd fds[2]{};
        fds[0].fd = s.native(); fds[0].events = POLLIN;
        int n = 1;
        if (cancel_fd >= 0) { fds[1].fd = cancel_fd; fds[1].events = kHangup; n = 2; }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return WaitResult::timeout;
        int r = ::poll(fds, n, static_cast<int>(left));
        if (r < 0) {
#ifndef _WIN32
            if (errno == EINTR) continue;
#endif
            return WaitResult::ready; // let the following read report the failure
        }
        if (r == 0) return WaitResult::timeout;
        if (n == 2 && (fds[1].revents & kHangup)) return WaitResult::cancelled;
        if (fds[0].revents) return WaitResult::ready;
    }
}

bool looks_stale(const Stream& s) {
    if (s.native() < 0) return false;
    if (s.has_pending()) return true;
    pollfd p{}; p.fd = s.native(); p.events = POLLIN;
    return ::poll(&p, 1, 0) != 0;
}

RelayStats relay(Stream& a, Stream& b, int idle_timeout_ms) {
    RelayStats stats;
    std::vector<char> buf(16384);
    auto lastActivity = std::chrono::steady_clock::now();
    auto pump = [&](Stream& from, Stream& to, std::size_t& counter) {
        auto r = from.read_some(buf.data(), buf.size());
        if (!r) return false;
        if (!to.write_all(std::string_view(buf.data(), *r))) return false;
        counter += *r;
        lastActivity = std::chrono::steady_clock::now();
        return true;
    };
    for (;;) {
        bool aReady = a.has_pending(), bReady = b.has_pending();
        if (!aReady && !bReady) {
            pollfd fds[2]{};
            fds[0].fd = a.native(); fds[0].events = POLLIN;
            fds[1].fd = b.native(); fds[1].events = POLLIN;
            int r = ::poll(fds, 2, 1000);
            if (r < 0) {
#ifndef _WIN32
                if (errno == EINTR) continue;
#endif
                break;
            }
            if (r == 0) {
                if (std::chrono::steady_clock::now() - lastActivity > std::chrono::milliseconds(idle_timeout_ms)) break;
                continue;
            }
            aReady = fds[0].revents != 0;
            bReady = fds[1].revents != 0;
        }
        if (aReady && !pump(a, b, stats.aToB)) break;
        if (bReady && !pump(b, a, stats.bToA)) break;
    }
    return stats;
}
}
