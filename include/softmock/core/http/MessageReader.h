#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <cstdint>
#include "softmock/core/net/Stream.h"
#include "softmock/core/http/HttpParser.h"

namespace softmock::core::http {
enum class BodyFraming { none, content_length, chunked, until_close };

struct BodySpec {
    BodyFraming framing{BodyFraming::none};
    uint64_t length{0};
};

// Framing of a request body; throws ProtocolError on a malformed Content-Length.
BodySpec request_body_spec(const HttpRequest& req);
// Framing of a response body to `request_method`.
BodySpec response_body_spec(const HttpResponse& resp, std::string_view request_method);

struct BodyResult {
    std::string decoded;   // de-chunked body, empty once overflowed
    std::string raw;       // wire bytes as received, empty once overflowed
    bool overflowed{false};
    uint64_t wireBytes{0};
};

// Buffered reader for HTTP/1.x messages on one stream. Bytes read past the end
// of a message stay buffered for the next one (pipelining).
class MessageReader {
public:
    using Overflow = std::function<void(std::string_view)>;
    using WaitHook = std::function<void()>;

    explicit MessageReader(net::Stream& stream, std::size_t max_head_bytes = 64 * 1024);

    // Raw head up to and including the blank line. nullopt when the peer
    // closes before sending a byte; ProtocolError when it closes mid-head or
    // the head exceeds the limit.
    std::optional<std::string> read_head();

    // Reads a body. Up to `cap` decoded bytes are kept in the result. When the
    // body grows past `cap`, `overflow` receives the raw bytes retained so far
    // and then every further raw chunk, and nothing more is retained.
    BodyResult read_body(const BodySpec& spec, std::size_t cap, const Overflow& overflow);

    // Called before every blocking read; may throw to abort (timeouts, cancellation).
    void set_wait_hook(WaitHook hook) { wait_ = std::move(hook); }
    bool has_buffered() const { return !buffer_.empty(); }
    // Hands over bytes read past the last message (used when switching to a raw relay).
    std::string take_buffered() { std::string out; out.swap(buffer_); return out; }
    net::Stream& stream() { return stream_; }
private:
    bool fill();
    net::Stream& stream_;
    std::string buffer_;
    std::size_t max_head_;
    WaitHook wait_;
};
}
