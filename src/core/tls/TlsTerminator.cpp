#include "softmock/core/tls/TlsTerminator.h"
#include "softmock/core/util/Logger.h"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <fmt/format.h>

namespace softmock::core::tls {
using util::TlsFailure;

struct TlsTerminator::Handshake {
    TlsTerminator* owner{nullptr};
    std::string hint;
    std::string served;
    std::shared_ptr<const LeafCertificate> leaf;
    bool noHostname{false};
    std::string caError;
};

namespace {
constexpr unsigned char kHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

// Drains the thread's error queue, keeping the first SSL-library reason.
int take_ssl_reason(std::string* text) {
    int reason = 0;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        if (reason == 0 && ERR_GET_LIB(e) == ERR_LIB_SSL) {
            reason = ERR_GET_REASON(e);
            if (text) {
                char buf[256];
                ERR_error_string_n(e, buf, sizeof(buf));
                *text = buf;
            }
        }
    }
    return reason;
}

bool is_ip_literal(const std::string& host) {
    ASN1_OCTET_STRING* ip = a2i_IPADDRESS(host.c_str());
    if (!ip) return false;
    ASN1_OCTET_STRING_free(ip);
    return true;
}
}

TlsTerminator::TlsTerminator(std::shared_ptr<CertificateAuthority> ca, TlsSettings settings)
    : ca_(std::move(ca)), settings_(std::move(settings)) {
    serverCtx_ = SSL_CTX_new(TLS_server_method());
    clientCtx_ = SSL_CTX_new(TLS_client_method());
    if (!serverCtx_ || !clientCtx_) {
        if (serverCtx_) SSL_CTX_free(serverCtx_);
        if (clientCtx_) SSL_CTX_free(clientCtx_);
        throw util::TlsError(TlsFailure::other, "", "cannot create TLS contexts");
    }
    SSL_CTX_set_min_proto_version(serverCtx_, TLS1_2_VERSION);
    SSL_CTX_set_options(serverCtx_, SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
    SSL_CTX_set_tlsext_servername_callback(serverCtx_, &TlsTerminator::on_servername);
    SSL_CTX_set_alpn_select_cb(serverCtx_, &TlsTerminator::on_alpn, nullptr);

    SSL_CTX_set_options(clientCtx_, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_alpn_protos(clientCtx_, kHttp11, sizeof(kHttp11));
    if (settings_.verifyUpstream) {
        SSL_CTX_set_default_verify_paths(clientCtx_);
        if (!settings_.upstreamCaFile.empty() &&
            SSL_CTX_load_verify_locations(clientCtx_, settings_.upstreamCaFile.c_str(), nullptr) != 1) {
            ERR_clear_error();
            util::log_warn(fmt::format("cannot load upstream trust file {}", settings_.upstreamCaFile));
        }
        SSL_CTX_set_verify(clientCtx_, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(clientCtx_, SSL_VERIFY_NONE, nullptr);
    }
}

TlsTerminator::~TlsTerminator() {
    SSL_CTX_free(serverCtx_);
    SSL_CTX_free(clientCtx_);
}

int TlsTerminator::handshake_index() {
    static int index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    return index;
}

bool TlsTerminator::install_leaf(SSL* ssl, Handshake& hs, const std::string& host) {
    if (hs.leaf && hs.served == host) return true;
    if (!ca_) {
        hs.caError = "no usable root certificate";
        return false;
    }
    try {
        hs.leaf = ca_->issue_leaf(host);
    } catch (const util::CaError& e) {
        hs.caError = e.what();
        return false;
    }
    if (SSL_use_certificate(ssl, hs.leaf->cert.get()) != 1 ||
        SSL_use_PrivateKey(ssl, hs.leaf->key.get()) != 1) {
        hs.caError = "cannot install leaf certificate for " + host;
        ERR_clear_error();
        return false;
    }
    SSL_clear_chain_certs(ssl);
    X509* root = ca_->root_certificate_ref();
    if (root) {
        SSL_add1_chain_cert(ssl, root);
        X509_free(root);
    }
    hs.served = host;
    return true;
}

int TlsTerminator::on_servername(SSL* ssl, int* alert, void*) {
    auto* hs = static_cast<Handshake*>(SSL_get_ex_data(ssl, handshake_index()));
    if (!hs) return SSL_TLSEXT_ERR_NOACK;
    const char* sni = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
    std::string host = (sni && *sni) ? std::string(sni) : hs->hint;
    if (host.empty()) {
        hs->noHostname = true;
        *alert = SSL_AD_UNRECOGNIZED_NAME;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
    if (!hs->owner->install_leaf(ssl, *hs, host)) {
        *alert = SSL_AD_INTERNAL_ERROR;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
    return SSL_TLSEXT_ERR_OK;
}

// Only HTTP/1.1 is spoken on the client side; without a match ALPN is left out.
int TlsTerminator::on_alpn(SSL*, const unsigned char** out, unsigned char* outlen,
                           const unsigned char* in, unsigned int inlen, void*) {
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kHttp11, sizeof(kHttp11), in, inlen) != OPENSSL_NPN_NEGOTIATED)
        return SSL_TLSEXT_ERR_NOACK;
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

TlsFailure TlsTerminator::classify_handshake_failure(int ssl_error, int reason) {
    switch (reason) {
        case SSL_R_TLSV1_ALERT_UNKNOWN_CA:
        case SSL_R_SSLV3_ALERT_BAD_CERTIFICATE:
        case SSL_R_SSLV3_ALERT_CERTIFICATE_UNKNOWN:
        case SSL_R_SSLV3_ALERT_UNSUPPORTED_CERTIFICATE:
        case SSL_R_SSLV3_ALERT_CERTIFICATE_EXPIRED:
        case SSL_R_SSLV3_ALERT_CERTIFICATE_REVOKED:
            return TlsFailure::certificate_rejected;
        case SSL_R_UNSUPPORTED_PROTOCOL:
        case SSL_R_WRONG_VERSION_NUMBER:
        case SSL_R_VERSION_TOO_LOW:
        case SSL_R_VERSION_TOO_HIGH:
        case SSL_R_NO_PROTOCOLS_AVAILABLE:
        case SSL_R_TLSV1_ALERT_PROTOCOL_VERSION:
            return TlsFailure::unsupported_version;
#ifdef SSL_R_UNEXPECTED_EOF_WHILE_READING
        case SSL_R_UNEXPECTED_EOF_WHILE_READING:
            return TlsFailure::client_abort;
#endif
        default: break;
    }
    if (ssl_error == SSL_ERROR_SYSCALL || ssl_error == SSL_ERROR_ZERO_RETURN) return TlsFailure::client_abort;
    return TlsFailure::other;
}

std::unique_ptr<TlsStream> TlsTerminator::accept(std::shared_ptr<net::Socket> socket, const std::string& host_hint) {
    SslPtr ssl(SSL_new(serverCtx_), SSL_free);
    if (!ssl) throw util::TlsError(TlsFailure::other, host_hint, "cannot allocate TLS session");
    Handshake hs;
    hs.owner = this;
    hs.hint = host_hint;
    SSL_set_ex_data(ssl.get(), handshake_index(), &hs);
    if (!host_hint.empty() && !install_leaf(ssl.get(), hs, host_hint)) throw util::CaError(hs.caError);
    SSL_set_fd(ssl.get(), socket->native());

    ERR_clear_error();
    int rc = SSL_accept(ssl.get());
    SSL_set_ex_data(ssl.get(), handshake_index(), nullptr);
    if (rc != 1) {
        int err = SSL_get_error(ssl.get(), rc);
        std::string detail;
        int reason = take_ssl_reason(&detail);
        if (!hs.caError.empty()) throw util::CaError(hs.caError);
        std::string host = hs.served.empty() ? host_hint : hs.served;
        if (hs.noHostname)
            throw util::TlsError(TlsFailure::hostname_unknown, host, "client sent no server name and no host is known");
        auto failure = classify_handshake_failure(err, reason);
        throw util::TlsError(failure, host, fmt::format("TLS handshake failed ({}): {}", util::to_string(failure),
                                                         detail.empty() ? "connection closed" : detail));
    }
    util::log_debug(fmt::format("TLS accepted host={} version={} cipher={}", hs.served,
                                SSL_get_version(ssl.get()), SSL_get_cipher(ssl.get())));
    return std::make_unique<TlsStream>(std::move(socket), std::move(ssl), hs.served);
}

std::unique_ptr<TlsStream> TlsTerminator::connect(std::shared_ptr<net::Socket> socket, const std::string& host, uint16_t port) {
    SslPtr ssl(SSL_new(clientCtx_), SSL_free);
    if (!ssl) throw util::UpstreamError(host, port, "cannot allocate TLS session");
    if (!is_ip_literal(host)) SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    if (settings_.verifyUpstream) SSL_set1_host(ssl.get(), host.c_str());
    SSL_set_fd(ssl.get(), socket->native());
    ERR_clear_error();
    int rc = SSL_connect(ssl.get());
    if (rc != 1) {
        std::string detail;
        take_ssl_reason(&detail);
        long verify = SSL_get_verify_result(ssl.get());
        if (settings_.verifyUpstream && verify != X509_V_OK)
            detail = X509_verify_cert_error_string(verify);
        throw util::UpstreamError(host, port, fmt::format("TLS handshake with {}:{} failed: {}", host, port,
                                                          detail.empty() ? "connection closed" : detail));
    }
    return std::make_unique<TlsStream>(std::move(socket), std::move(ssl), host);
}
}
