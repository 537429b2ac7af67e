#include "softmock/core/proxy/ClientSession.h"
#include "softmock/core/proxy/Preamble.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>

namespace softmock::core::proxy {
using util::log_debug;
using util::log_info;
using util::log_warn;
using util::log_error;

namespace {
const char* kEstablished = "HTTP/1.1 200 Connection Established\r\n\r\n";
const char* kBadRequest = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
}

ClientSession::ClientSession(std::shared_ptr<net::Socket> socket, SessionServices services, std::string peer_name)
    : sock(std::move(socket)), svc(services), peer(std::move(peer_name)) {}

void ClientSession::run() {
    try {
        process();
    } catch (const util::TlsError& e) {
        if (e.hostname_related())
            log_warn(fmt::format("{} TLS {} for {}: {} (is the softmock root CA trusted by the client?)", peer,
                                 util::to_string(e.failure()), e.host(), e.what()));
        else
            log_info(fmt::format("{} TLS {} for {}: {}", peer, util::to_string(e.failure()), e.host(), e.what()));
    } catch (const util::CancelledError& e) {
        log_debug(fmt::format("{} {}", peer, e.what()));
    } catch (const util::ProxyError& e) {
        log_warn(fmt::format("{} {}: {}", peer, util::to_string(e.kind()), e.what()));
    } catch (const std::exception& e) {
        log_error(fmt::format("{} session aborted: {}", peer, e.what()));
    }
    sock->close();
}

void ClientSession::process() {
    const Config& cfg = *svc.config;
    auto kind = sniff(*sock, cfg.handshakeTimeoutMs);
    if (!kind) return;
    if (*kind == Preamble::tls) {
        // transparent TLS: only SNI can tell which host is meant
        terminate_tls("", "", cfg.transparentTlsPort);
        return;
    }
    if (*kind == Preamble::unknown) {
        if (!sock->send_all(kBadRequest)) log_debug(peer + " left before the 400 was sent");
        throw util::ProtocolError("unrecognised protocol preamble");
    }

    http::MessageReader reader(*sock);
    auto head = reader.read_head();
    if (!head) return;
    http::HttpParser parser;
    auto req = parser.parse_request(*head);
    if (!req) {
        if (!sock->send_all(kBadRequest)) log_debug(peer + " left before the 400 was sent");
        throw util::ProtocolError("malformed request head");
    }
    if (req->request_line.method == "CONNECT") {
        handle_connect(reader, *req);
        return;
    }
    ConnectionContext ctx;
    ctx.cancelFd = sock->native();
    ctx.peer = peer;
    svc.interceptor->serve(*sock, reader, ctx, std::move(*head));
}

void ClientSession::handle_connect(http::MessageReader& reader, const http::HttpRequest& req) {
    const Config& cfg = *svc.config;
    auto target = parse_connect_target(req);
    if (!target) {
        if (!sock->send_all(kBadRequest)) log_debug(peer + " left before the 400 was sent");
        throw util::ProtocolError("malformed CONNECT target '" + req.request_line.target + "'");
    }
    if (reader.has_buffered()) throw util::ProtocolError("client sent tunnel data before the tunnel was established");

    bool intercept = svc.terminator->can_terminate() && svc.interceptPolicy->allows(target->host);
    if (!intercept) {
        blind_tunnel(target->host, target->port, true);
        return;
    }
    if (!sock->send_all(kEstablished)) return;

    auto kind = sniff(*sock, cfg.handshakeTimeoutMs);
    if (!kind) return;
    switch (*kind) {
        case Preamble::tls:
            terminate_tls(target->host, target->host, target->port);
            return;
        case Preamble::http: {
            http::MessageReader tunnelled(*sock);
            ConnectionContext ctx;
            ctx.upstreamHost = target->host;
            ctx.upstreamPort = target->port;
            ctx.cancelFd = sock->native();
            ctx.peer = peer;
            svc.interceptor->serve(*sock, tunnelled, ctx);
            return;
        }
        case Preamble::unknown:
            log_debug(fmt::format("{} CONNECT {}:{} carries an unknown protocol, tunnelling", peer, target->host, target->port));
            blind_tunnel(target->host, target->port, false);
            return;
    }
}

void ClientSession::terminate_tls(const std::string& host_hint, const std::string& upstream_host, uint16_t upstream_port) {
    const Config& cfg = *svc.config;
    if (!sock->set_timeouts(cfg.handshakeTimeoutMs, cfg.handshakeTimeoutMs)) log_debug(peer + " cannot set handshake timeouts");
    auto tlsStream = svc.terminator->accept(sock, host_hint);
    if (!sock->set_timeouts(0, 0)) log_debug(peer + " cannot clear handshake timeouts");

    ConnectionContext ctx;
    ctx.scheme = "https";
    ctx.tls = true;
    ctx.upstreamHost = upstream_host.empty() ? tlsStream->peer_host() : upstream_host;
    ctx.upstreamPort = upstream_port;
    ctx.cancelFd = sock->native();
    ctx.peer = peer;
    log_debug(fmt::format("{} TLS terminated for {} ({}, {})", peer, tlsStream->peer_host(),
                          tlsStream->protocol_version(), tlsStream->cipher()));
    http::MessageReader reader(*tlsStream);
    svc.interceptor->serve(*tlsStream, reader, ctx);
    tlsStream->close();
}

void ClientSession::blind_tunnel(const std::string& host, uint16_t port, bool reply_established) {
    std::unique_ptr<net::Stream> upstream;
    try {
        upstream = svc.dialer->dial(host, port, false);
    } catch (const util::UpstreamError&) {
        if (reply_established && !sock->send_all(FlowInterceptor::bad_gateway(host + ":" + std::to_string(port) + " unreachable")))
            log_debug(peer + " left before the 502 was sent");
        throw;
    }
    if (reply_established && !sock->send_all(kEstablished)) return;
    log_debug(fmt::format("{} blind tunnel to {}:{}", peer, host, port));
    auto stats = net::relay(*sock, *upstream, svc.config->tunnelIdleTimeoutMs);
    log_debug(fmt::format("{} tunnel {}:{} closed: {} bytes up, {} bytes down", peer, host, port, stats.aToB, stats.bToA));
}
}
