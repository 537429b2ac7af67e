#pragma once
#include <string>
#include <optional>
#include "softmock/core/net/Socket.h"

namespace softmock::core::net {
class UpstreamConnector {
public:
    // Resolves `host` and connects to the first reachable address within
    // `timeout_ms` per attempt. On failure `error` (if given) says why.
    static std::optional<Socket> connect(const std::string& host, uint16_t port, int timeout_ms = 3000, std::string* error = nullptr);
};
}
