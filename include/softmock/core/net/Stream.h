#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace softmock::core::net {
// Byte stream a proxy exchange runs over: a plain socket or a TLS session.
class Stream {
public:
    virtual ~Stream() = default;
    // Reads up to `len` bytes; nullopt on orderly close or error.
    virtual std::optional<std::size_t> read_some(char* data, std::size_t len) = 0;
    virtual bool write_all(std::string_view data) = 0;
    virtual void close() = 0;
    // Underlying descriptor, -1 for streams without one (tests).
    virtual int native() const { return -1; }
    // Bytes already decrypted/buffered that a poll() on native() would not report.
    virtual bool has_pending() const { return false; }
};

enum class WaitResult { ready, timeout, cancelled };

// Blocks until `s` is readable. `cancel_fd` (optional, -1 to ignore) is watched
// for peer hang-up; if it closes first the wait ends with `cancelled`.
WaitResult wait_readable(const Stream& s, int cancel_fd, int timeout_ms);

// True if `s` is readable right now with nothing pending, i.e. the peer sent
// something unsolicited or closed; used to discard idle upstream connections.
bool looks_stale(const Stream& s);

// Copies bytes in both directions until either side closes or nothing moves
// for `idle_timeout_ms`. Returns bytes moved {a->b, b->a}.
struct RelayStats { std::size_t aToB{0}; std::size_t bToA{0}; };
RelayStats relay(Stream& a, Stream& b, int idle_timeout_ms);
}
