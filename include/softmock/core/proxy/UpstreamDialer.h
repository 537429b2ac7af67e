#pragma once
#include <memory>
#include <string>
#include <cstdint>
#include "softmock/core/net/Stream.h"
#include "softmock/core/tls/TlsTerminator.h"

namespace softmock::core::proxy {
// Source of upstream connections. Tests substitute an in-memory dialer.
class UpstreamDialer {
public:
    virtual ~UpstreamDialer() = default;
    // Connected stream to host:port, TLS-wrapped when `tls`. Throws UpstreamError.
    virtual std::unique_ptr<net::Stream> dial(const std::string& host, uint16_t port, bool tls) = 0;
};

class NetworkDialer : public UpstreamDialer {
public:
    NetworkDialer(std::shared_ptr<tls::TlsTerminator> tls, int connect_timeout_ms, int io_timeout_ms)
        : tls_(std::move(tls)), connectTimeoutMs_(connect_timeout_ms), ioTimeoutMs_(io_timeout_ms) {}
    std::unique_ptr<net::Stream> dial(const std::string& host, uint16_t port, bool tls) override;
private:
    std::shared_ptr<tls::TlsTerminator> tls_;
    int connectTimeoutMs_;
    int ioTimeoutMs_;
};
}
