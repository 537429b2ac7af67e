#include "softmock/core/net/Socket.h"
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif
#include <cstring>

namespace softmock::core::net {
namespace {
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
inline int close_native(int fd) {
#ifdef _WIN32
    return closesocket(fd);
#else
    return ::close(fd);
#endif
}
inline bool set_nb(int fd, bool on) {
#ifdef _WIN32
    u_long mode = on ? 1 : 0; return ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(fd, F_GETFL, 0); if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
#endif
}
inline bool interrupted() {
#ifdef _WIN32
    return false;
#else
    return errno == EINTR;
#endif
}
}

Socket::Socket() = default;
Socket::Socket(int fd) : handle(fd) {}
Socket::Socket(Socket&& other) noexcept : handle(other.handle) { other.handle = -1; }
Socket& Socket::operator=(Socket&& other) noexcept { if (this != &other) { close(); handle = other.handle; other.handle = -1; } return *this; }
Socket::~Socket() { close(); }
bool Socket::valid() const { return handle >= 0; }
int Socket::native() const { return handle; }
void Socket::close() { if (handle >= 0) { close_native(handle); handle = -1; } }
void Socket::shutdown() {
    if (handle < 0) return;
#ifdef _WIN32
    ::shutdown(handle, SD_BOTH);
#else
    ::shutdown(handle, SHUT_RDWR);
#endif
}
bool Socket::set_non_blocking() { if (!valid()) return false; return set_nb(handle, true); }
bool Socket::set_blocking() { if (!valid()) return false; return set_nb(handle, false); }
bool Socket::set_timeouts(int recv_timeout_ms, int send_timeout_ms) {
    if (!valid()) return false;
#ifdef _WIN32
    DWORD rt = (DWORD)recv_timeout_ms, st = (DWORD)send_timeout_ms;
    bool ok = setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&rt), sizeof(rt)) == 0;
    ok = setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&st), sizeof(st)) == 0 && ok;
    return ok;
#else
    timeval rt{ recv_timeout_ms / 1000, (recv_timeout_ms % 1000) * 1000 };
    timeval st{ send_timeout_ms / 1000, (send_timeout_ms % 1000) * 1000 };
    bool ok = setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &rt, sizeof(rt)) == 0;
    ok = setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, &st, sizeof(st)) == 0 && ok;
    return ok;
#endif
}
std::optional<int> Socket::recv_some(std::vector<char>& buffer) {
    auto r = read_some(buffer.data(), buffer.size());
    if (!r) return std::nullopt;
    return static_cast<int>(*r);
}
std::optional<std::size_t> Socket::read_some(char* data, std::size_t len) {
    if (!valid() || len == 0) return std::nullopt;
    for (;;) {
#ifdef _WIN32
        int r = ::recv(handle, data, static_cast<int>(len), 0);
#else
        int r = static_cast<int>(::recv(handle, data, len, 0));
#endif
        if (r < 0 && interrupted()) continue;
        if (r <= 0) return std::nullopt;
        return static_cast<std::size_t>(r);
    }
}
std::optional<std::size_t> Socket::peek_some(char* data, std::size_t len) {
    if (!valid() || len == 0) return std::nullopt;
    for (;;) {
#ifdef _WIN32
        int r = ::recv(handle, data, static_cast<int>(len), MSG_PEEK);
#else
        int r = static_cast<int>(::recv(handle, data, len, MSG_PEEK));
#endif
        if (r < 0 && interrupted()) continue;
        if (r <= 0) return std::nullopt;
        return static_cast<std::size_t>(r);
    }
}
bool Socket::send_all(std::string_view data) {
    if (!valid()) return false;
    const char* p = data.data(); size_t remaining = data.size();
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(handle, p, static_cast<int>(remaining), 0);
#else
        int sent = static_cast<int>(::send(handle, p, remaining, kSendFlags));
#endif
        if (sent < 0 && interrupted()) continue;
        if (sent <= 0) return false; p += sent; remaining -= sent;
    }
    return true;
}

Listener::Listener() = default;
Listener::~Listener() { close(); }
bool Listener::valid() const { return handle >= 0; }
int Listener::native() const { return handle; }
void Listener::close() { if (handle >= 0) { close_native(handle); handle = -1; } }
bool Listener::open(uint16_t port) { return open("0.0.0.0", port); }
bool Listener::open(const std::string& address, uint16_t port) {
    handle = ::socket(AF_INET, SOCK_STREAM, 0);
    if (handle < 0) return false;
    int yes = 1;
#ifdef _WIN32
    setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
#else
    setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#endif
    sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) { close(); return false; }
    if (bind(handle, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) { close(); return false; }
    if (listen(handle, 128) < 0) { close(); return false; }
    set_nb(handle, true);
    return true;
}
uint16_t Listener::local_port() const {
    if (!valid()) return 0;
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    if (getsockname(handle, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}
Socket Listener::accept() {
    if (!valid()) return Socket();
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    int c = static_cast<int>(::accept(handle, reinterpret_cast<sockaddr*>(&addr), &len));
    if (c < 0) return Socket();
    Socket s(c); s.set_blocking(); return s;
}
}
