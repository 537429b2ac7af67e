#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include "softmock/core/net/Socket.h"
#include "softmock/core/http/HttpParser.h"

namespace softmock::core::proxy {
enum class Preamble { tls, http, unknown };

// Classifies the first bytes of a connection: a TLS record starts with 0x16,
// an HTTP/1.x request with an uppercase method token.
Preamble classify_preamble(std::string_view first_bytes);

// Waits up to `timeout_ms` for the first byte and peeks at it without consuming.
// nullopt when the peer closes or stays silent.
std::optional<Preamble> sniff(net::Socket& sock, int timeout_ms);

struct ConnectTarget { std::string host; uint16_t port{443}; };
// host:port of a CONNECT request; nullopt when malformed.
std::optional<ConnectTarget> parse_connect_target(const http::HttpRequest& req);
}
