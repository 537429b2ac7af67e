#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include "softmock/core/net/Stream.h"

namespace softmock::core::net {
class Socket : public Stream {
public:
    Socket();
    explicit Socket(int fd);
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket() override;
    bool valid() const;
    int native() const override;
    void close() override;
    // Stops both directions without releasing the descriptor; wakes a thread blocked in recv.
    void shutdown();
    bool set_non_blocking();
    bool set_blocking();
    bool set_timeouts(int recv_timeout_ms, int send_timeout_ms);
    std::optional<int> recv_some(std::vector<char>& buffer);
    // Copies up to `len` bytes without consuming them.
    std::optional<std::size_t> peek_some(char* data, std::size_t len);
    bool send_all(std::string_view data);
    std::optional<std::size_t> read_some(char* data, std::size_t len) override;
    bool write_all(std::string_view data) override { return send_all(data); }
private:
    int handle{-1};
};

class Listener {
public:
    Listener();
    ~Listener();
    bool open(uint16_t port);
    bool open(const std::string& address, uint16_t port);
    // Returns an invalid Socket when nothing is pending. Accepted sockets are blocking.
    Socket accept();
    void close();
    bool valid() const;
    int native() const;
    uint16_t local_port() const;
private:
    int handle{-1};
};
}
