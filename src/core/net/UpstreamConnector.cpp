#include "softmock/core/net/UpstreamConnector.h"
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#define poll WSAPoll
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif
#include <cstring>
#include <chrono>

namespace softmock::core::net {
namespace {
#ifdef _WIN32
using native_t = SOCKET;
inline void close_fd(native_t s) { closesocket(s); }
inline int last_error() { return WSAGetLastError(); }
inline bool in_progress(int err) { return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS; }
inline void set_nb(native_t s, bool on) { u_long mode = on ? 1 : 0; ioctlsocket(s, FIONBIO, &mode); }
#else
using native_t = int;
inline void close_fd(native_t s) { ::close(s); }
inline int last_error() { return errno; }
inline bool in_progress(int err) { return err == EINPROGRESS; }
inline void set_nb(native_t s, bool on) { int flags = fcntl(s, F_GETFL, 0); fcntl(s, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)); }
#endif

// Waits for a pending connect to finish. 1 ready, 0 timed out, -1 failed.
int wait_connected(native_t s, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left < 0) left = 0;
        pollfd pfd{}; pfd.fd = s; pfd.events = POLLOUT;
        int r = ::poll(&pfd, 1, static_cast<int>(left));
#ifndef _WIN32
        if (r < 0 && errno == EINTR) continue;
#endif
        return r;
    }
}
}

std::optional<Socket> UpstreamConnector::connect(const std::string& host, uint16_t port, int timeout_ms, std::string* error) {
    auto fail = [&](std::string why) -> std::optional<Socket> { if (error) *error = std::move(why); return std::nullopt; };
    auto port_str = std::to_string(port);
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM; hints.ai_protocol = IPPROTO_TCP;
    addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) return fail(std::string("resolve failed: ") + gai_strerror(gai));
    std::string lastWhy = "no usable address";
    for (auto p = res; p; p = p->ai_next) {
        native_t s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
#ifdef _WIN32
        if (s == INVALID_SOCKET) continue;
#else
        if (s < 0) continue;
#endif
        set_nb(s, true);
        int r = ::connect(s, p->ai_addr, static_cast<int>(p->ai_addrlen));
        if (r != 0) {
            int err = last_error();
            if (!in_progress(err)) { lastWhy = std::string("connect failed: ") + std::strerror(err); close_fd(s); continue; }
            int sel = wait_connected(s, timeout_ms);
            if (sel <= 0) { lastWhy = sel == 0 ? "connect timed out" : "connect wait failed"; close_fd(s); continue; }
            int soerr = 0; socklen_t len = sizeof(soerr);
            getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soerr), &len);
            if (soerr != 0) { lastWhy = std::string("connect failed: ") + std::strerror(soerr); close_fd(s); continue; }
        }
        set_nb(s, false);
        ::freeaddrinfo(res);
        return Socket(static_cast<int>(s));
    }
    if (res) ::freeaddrinfo(res);
    return fail(lastWhy);
}
}
