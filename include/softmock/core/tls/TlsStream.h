#pragma once
#include <memory>
#include <string>
#include <openssl/ssl.h>
#include "softmock/core/net/Socket.h"

namespace softmock::core::tls {
using SslPtr = std::unique_ptr<SSL, decltype(&SSL_free)>;

// Established TLS session over a socket it shares with the owning session.
class TlsStream : public net::Stream {
public:
    TlsStream(std::shared_ptr<net::Socket> socket, SslPtr ssl, std::string peer_host);
    ~TlsStream() override;
    std::optional<std::size_t> read_some(char* data, std::size_t len) override;
    bool write_all(std::string_view data) override;
    void close() override;
    int native() const override;
    bool has_pending() const override;

    const std::string& peer_host() const { return host_; }
    std::string protocol_version() const;
    std::string cipher() const;
    std::string alpn() const;
private:
    std::shared_ptr<net::Socket> sock_;
    SslPtr ssl_;
    std::string host_;
    bool closed_{false};
};
}
