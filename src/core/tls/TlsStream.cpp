#include "softmock/core/tls/TlsStream.h"
#include <openssl/err.h>
#include <climits>
#include <algorithm>

namespace softmock::core::tls {
TlsStream::TlsStream(std::shared_ptr<net::Socket> socket, SslPtr ssl, std::string peer_host)
    : sock_(std::move(socket)), ssl_(std::move(ssl)), host_(std::move(peer_host)) {}

TlsStream::~TlsStream() { close(); }

std::optional<std::size_t> TlsStream::read_some(char* data, std::size_t len) {
    if (closed_ || len == 0) return std::nullopt;
    int n = SSL_read(ssl_.get(), data, static_cast<int>(std::min<std::size_t>(len, INT_MAX)));
    if (n > 0) return static_cast<std::size_t>(n);
    ERR_clear_error();
    return std::nullopt;
}

bool TlsStream::write_all(std::string_view data) {
    if (closed_) return false;
    const char* p = data.data(); std::size_t remaining = data.size();
    while (remaining > 0) {
        int n = SSL_write(ssl_.get(), p, static_cast<int>(std::min<std::size_t>(remaining, INT_MAX)));
        if (n <= 0) { ERR_clear_error(); return false; }
        p += n; remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

void TlsStream::close() {
    if (closed_) return;
    closed_ = true;
    if (SSL_get_shutdown(ssl_.get()) == 0 && SSL_is_init_finished(ssl_.get())) SSL_shutdown(ssl_.get());
    ERR_clear_error();
    if (sock_) sock_->close();
}

int TlsStream::native() const { return sock_ ? sock_->native() : -1; }

bool TlsStream::has_pending() const { return !closed_ && SSL_pending(ssl_.get()) > 0; }

std::string TlsStream::protocol_version() const { return SSL_get_version(ssl_.get()); }

std::string TlsStream::cipher() const {
    const char* c = SSL_get_cipher(ssl_.get());
    return c ? c : "";
}

std::string TlsStream::alpn() const {
    const unsigned char* p = nullptr; unsigned int n = 0;
    SSL_get0_alpn_selected(ssl_.get(), &p, &n);
    return (p && n) ? std::string(reinterpret_cast<const char*>(p), n) : std::string();
}
}
