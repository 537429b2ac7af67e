#pragma once
#include <memory>
#include <string>
#include <cstdint>
#include <openssl/ssl.h>
#include "softmock/core/net/Socket.h"
#include "softmock/core/tls/CertificateAuthority.h"
#include "softmock/core/tls/TlsStream.h"
#include "softmock/core/util/Error.h"

namespace softmock::core::tls {
struct TlsSettings {
    bool verifyUpstream{false};
    // extra trust anchors for upstream verification; system defaults are always loaded
    std::string upstreamCaFile;
};

// Terminates client TLS with leaf certificates issued by the CA and opens
// TLS sessions towards upstream servers. Safe to share between sessions.
// Without a CA only the upstream side is available.
class TlsTerminator {
public:
    TlsTerminator(std::shared_ptr<CertificateAuthority> ca, TlsSettings settings = {});
    ~TlsTerminator();
    TlsTerminator(const TlsTerminator&) = delete;
    TlsTerminator& operator=(const TlsTerminator&) = delete;

    // Server-side handshake. The certificate follows SNI, falling back to
    // `host_hint` (the CONNECT authority) when the client sends none.
    // Throws TlsError, or CaError when no leaf could be issued.
    std::unique_ptr<TlsStream> accept(std::shared_ptr<net::Socket> socket, const std::string& host_hint);

    // Client-side handshake towards an upstream server. Throws UpstreamError.
    std::unique_ptr<TlsStream> connect(std::shared_ptr<net::Socket> socket, const std::string& host, uint16_t port);

    CertificateAuthority* ca() const { return ca_.get(); }
    bool can_terminate() const { return ca_ != nullptr; }
    const TlsSettings& settings() const { return settings_; }

    static util::TlsFailure classify_handshake_failure(int ssl_error, int reason);
private:
    struct Handshake;
    static int on_servername(SSL* ssl, int* alert, void* arg);
    static int on_alpn(SSL* ssl, const unsigned char** out, unsigned char* outlen,
                       const unsigned char* in, unsigned int inlen, void* arg);
    static int handshake_index();
    bool install_leaf(SSL* ssl, Handshake& hs, const std::string& host);

    std::shared_ptr<CertificateAuthority> ca_;
    TlsSettings settings_;
    SSL_CTX* serverCtx_{nullptr};
    SSL_CTX* clientCtx_{nullptr};
};
}
