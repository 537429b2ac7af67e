#include "softmock/core/proxy/FlowInterceptor.h"
#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>

namespace softmock::core::proxy {
using util::log_debug;
using util::log_info;
using util::log_warn;

struct FlowInterceptor::UpstreamLink {
    std::unique_ptr<net::Stream> stream;
    std::unique_ptr<http::MessageReader> reader;
    std::string key;
    void reset() {
        reader.reset();
        if (stream) stream->close();
        stream.reset();
        key.clear();
    }
    ~UpstreamLink() { reset(); }
};

namespace {
std::string simple_response(int code, std::string_view reason, std::string_view body, bool close = false) {
    return fmt::format("HTTP/1.1 {} {}\r\nContent-Type: text/plain; charset=utf-8\r\nContent-Length: {}\r\n{}\r\n{}",
                       code, reason, body.size(), close ? "Connection: close\r\n" : "", body);
}

void send_best_effort(net::Stream& client, const std::string& text) {
    if (!client.write_all(text)) log_debug("client closed before the error response was sent");
}

bool client_keeps_alive(const http::HttpRequest& req) {
    if (http::has_token(req.headers, "connection", "close") || http::has_token(req.headers, "proxy-connection", "close")) return false;
    if (req.request_line.version == "HTTP/1.0")
        return http::has_token(req.headers, "connection", "keep-alive") || http::has_token(req.headers, "proxy-connection", "keep-alive");
    return true;
}

bool upstream_keeps_alive(const http::HttpResponse& resp, const http::BodySpec& spec) {
    if (spec.framing == http::BodyFraming::until_close) return false;
    if (http::has_token(resp.headers, "connection", "close")) return false;
    if (resp.status_line.version == "HTTP/1.0") return http::has_token(resp.headers, "connection", "keep-alive");
    return true;
}

// Next response head from upstream; malformed or missing answers are upstream failures.
std::pair<std::string, http::HttpResponse> next_response_head(http::MessageReader& reader, const std::string& host, uint16_t port) {
    std::optional<std::string> raw;
    try {
        raw = reader.read_head();
    } catch (const util::ProtocolError& e) {
        throw util::UpstreamError(host, port, e.what());
    }
    if (!raw) throw util::UpstreamError(host, port, fmt::format("{}:{} closed the connection without a response", host, port));
    http::HttpParser parser;
    auto parsed = parser.parse_response(*raw);
    if (!parsed) throw util::UpstreamError(host, port, fmt::format("malformed response head from {}:{}", host, port));
    return { std::move(*raw), std::move(*parsed) };
}

flow::RecordedResponse to_recorded(const http::HttpResponse& resp, std::string body) {
    flow::RecordedResponse out;
    out.version = resp.status_line.version;
    out.status = resp.status_line.code;
    out.reason = resp.status_line.reason;
    out.headers = resp.headers;
    out.body = std::move(body);
    return out;
}
}

FlowInterceptor::FlowInterceptor(const Config& cfg, flow::FlowStore& store, UpstreamDialer& dialer,
                                 const InterceptPolicy& record_policy, std::shared_ptr<tls::CertificateAuthority> ca)
    : cfg_(cfg), store_(store), dialer_(dialer), recordPolicy_(record_policy), ca_(std::move(ca)) {}

std::string FlowInterceptor::bad_gateway(const std::string& why) {
    return simple_response(502, "Bad Gateway", "softmock: upstream request failed: " + why + "\n");
}

FlowInterceptor::UpstreamLink& FlowInterceptor::connect_upstream(UpstreamLink& link, const std::string& host, uint16_t port, bool tls, int cancel_fd) {
    std::string key = fmt::format("{}:{}:{}", host, port, tls ? "tls" : "tcp");
    if (link.stream && link.key == key && !net::looks_stale(*link.stream)) return link;
    link.reset();
    link.stream = dialer_.dial(host, port, tls);
    link.reader = std::make_unique<http::MessageReader>(*link.stream);
    link.key = key;
    net::Stream* up = link.stream.get();
    int timeout = cfg_.upstreamReadTimeoutMs;
    link.reader->set_wait_hook([up, cancel_fd, timeout, host, port]{
        switch (net::wait_readable(*up, cancel_fd, timeout)) {
            case net::WaitResult::ready: return;
            case net::WaitResult::timeout:
                throw util::UpstreamError(host, port, fmt::format("no data from {}:{} within {} ms", host, port, timeout));
            case net::WaitResult::cancelled:
                throw util::CancelledError(fmt::format("client hung up while waiting for {}:{}", host, port));
        }
    });
    return link;
}

bool FlowInterceptor::serve_local_ca(net::Stream& client, const http::HostTarget& target, bool head_only) {
    if (!ca_) return false;
    std::string path = target.path.substr(0, target.path.find('?'));
    bool magicHost = target.host == "ssl" || target.host == "cert" || target.host == "ca";
    bool der;
    if (path == "/__softmock/ca.der" || (magicHost && path.size() >= 4 && path.compare(path.size() - 4, 4, ".der") == 0)) der = true;
    else if (path == "/__softmock/ca.pem" || magicHost) der = false;
    else return false;

    std::string content = der ? ca_->export_ca_der() : ca_->export_ca_pem();
    std::string resp = fmt::format("HTTP/1.1 200 OK\r\nContent-Type: {}\r\nContent-Length: {}\r\n"
                                   "Content-Disposition: attachment; filename=\"softmock_root_ca.{}\"\r\n\r\n",
                                   der ? "application/x-x509-ca-cert" : "application/x-pem-file",
                                   content.size(), der ? "der" : "pem");
    if (!head_only) resp += content;
    if (!client.write_all(resp)) log_debug("client left before the root certificate was sent");
    else log_info(fmt::format("served root certificate ({}) via {}{}", der ? "DER" : "PEM", target.host, path));
    return true;
}

void FlowInterceptor::serve(net::Stream& client, http::MessageReader& reader, const ConnectionContext& ctx,
                            std::optional<std::string> first_head) {
    UpstreamLink link;
    int idle = cfg_.clientIdleTimeoutMs;
    reader.set_wait_hook([&client, idle]{
        if (net::wait_readable(client, -1, idle) != net::WaitResult::ready)
            throw util::ProtocolError(fmt::format("client stalled for {} ms inside a request", idle));
    });
    std::optional<std::string> head = std::move(first_head);
    for (;;) {
        if (!head) {
            // keep-alive connections that go quiet end without an error
            if (!reader.has_buffered() && net::wait_readable(client, -1, idle) != net::WaitResult::ready) break;
            head = reader.read_head();
            if (!head) break;
        }
        bool again = handle(client, reader, ctx, *head, link);
        head.reset();
        if (!again) break;
    }
    reader.set_wait_hook(nullptr);
}

bool FlowInterceptor::handle(net::Stream& client, http::MessageReader& reader, const ConnectionContext& ctx,
                             const std::string& head, UpstreamLink& link) {
    http::HttpParser parser;
    auto req = parser.parse_request(head);
    if (!req) {
        send_best_effort(client, simple_response(400, "Bad Request", "malformed request\n", true));
        throw util::ProtocolError("malformed request head from " + ctx.peer);
    }
    const std::string method = req->request_line.method;
    if (method == "CONNECT") {
        send_best_effort(client, simple_response(405, "Method Not Allowed", "CONNECT inside an established connection\n", true));
        return false;
    }

    auto target = http::extract_host_target(*req, ctx.scheme);
    if (!target && !ctx.upstreamHost.empty()) {
        http::HostTarget t;
        t.scheme = ctx.scheme;
        t.host = ctx.upstreamHost;
        t.port = ctx.upstreamPort;
        const auto& rt = req->request_line.target;
        t.path = (rt.empty() || rt.front() != '/') ? "/" + rt : rt;
        target = t;
    }
    if (!target) {
        send_best_effort(client, simple_response(400, "Bad Request", "request names no host\n", true));
        throw util::ProtocolError("request without a usable host: " + req->request_line.target);
    }
    const bool tunnelled = !ctx.upstreamHost.empty();
    const std::string dialHost = tunnelled ? ctx.upstreamHost : target->host;
    const uint16_t dialPort = tunnelled ? ctx.upstreamPort : target->port;
    const bool dialTls = ctx.tls || target->scheme == "https";
    const bool keepAlive = client_keeps_alive(*req);
    const bool headOnly = method == "HEAD";

    if (!ctx.tls && serve_local_ca(client, *target, headOnly)) return keepAlive;

    auto bodySpec = http::request_body_spec(*req);
    http::HeaderList headers = req->headers;
    http::remove_header(headers, "Proxy-Connection");
    http::remove_header(headers, "Proxy-Authorization");
    if (http::has_token(headers, "expect", "100-continue")) {
        http::remove_header(headers, "Expect");
        if (bodySpec.framing != http::BodyFraming::none && !client.write_all("HTTP/1.1 100 Continue\r\n\r\n")) return false;
    }
    if (!http::find_header(headers, "host")) http::set_header(headers, "Host", http::format_authority(target->scheme, target->host, target->port));
    const std::string fwdHead = fmt::format("{} {} {}\r\n", method, target->path, req->request_line.version)
                              + http::serialize_headers(headers) + "\r\n";
    const std::string url = target->scheme + "://" + http::format_authority(target->scheme, target->host, target->port) + target->path;

    bool passthrough = false;
    bool committed = false; // bytes of the answer already reached the client
    try {
        auto onRequestOverflow = [&](std::string_view raw) {
            if (!passthrough) {
                passthrough = true;
                log_warn(fmt::format("{} {}: {}; forwarded without recording", method, url,
                                     util::BodyTooLargeError(cfg_.maxBodyBytes).what()));
                connect_upstream(link, dialHost, dialPort, dialTls, ctx.cancelFd);
                if (!link.stream->write_all(fwdHead)) throw util::UpstreamError(dialHost, dialPort, "write to upstream failed");
            }
            if (!raw.empty() && !link.stream->write_all(raw)) throw util::UpstreamError(dialHost, dialPort, "write to upstream failed");
        };
        auto body = reader.read_body(bodySpec, cfg_.maxBodyBytes, onRequestOverflow);

        flow::RecordedRequest rec;
        rec.method = method;
        rec.scheme = target->scheme;
        rec.host = target->host;
        rec.port = target->port;
        rec.target = target->path;
        rec.version = req->request_line.version;
        rec.headers = headers;
        rec.body = std::move(body.decoded);

        const bool recording = !passthrough && recordPolicy_.allows(target->host);
        std::optional<flow::FlowIdentity> identity;
        if (recording) {
            identity = store_.identify(rec);
            if (auto served = store_.resolve_override(*identity)) {
                log_debug(fmt::format("{} {} served from override {}", method, url, identity->id.substr(0, 12)));
                if (!client.write_all(flow::serialize_response(*served, !headOnly))) return false;
                return keepAlive;
            }
        }

        if (!passthrough) {
            connect_upstream(link, dialHost, dialPort, dialTls, ctx.cancelFd);
            if (!link.stream->write_all(fwdHead) || (!body.raw.empty() && !link.stream->write_all(body.raw)))
                throw util::UpstreamError(dialHost, dialPort, "write to upstream failed");
        }

        for (;;) {
            auto next = next_response_head(*link.reader, dialHost, dialPort);
            const std::string& rawHead = next.first;
            const http::HttpResponse& resp = next.second;
            int code = resp.status_line.code;
            if (code == 101) {
                committed = true;
                if (!client.write_all(rawHead)) return false;
                auto pending = link.reader->take_buffered();
                if (!pending.empty() && !client.write_all(pending)) return false;
                auto early = reader.take_buffered();
                if (!early.empty() && !link.stream->write_all(early)) return false;
                log_debug(fmt::format("{} {} switched protocols, relaying", method, url));
                auto stats = net::relay(client, *link.stream, cfg_.tunnelIdleTimeoutMs);
                log_debug(fmt::format("upgrade relay {} closed: {} bytes up, {} bytes down", url, stats.aToB, stats.bToA));
                link.reset();
                return false;
            }
            if (code >= 100 && code < 200) {
                committed = true;
                if (!client.write_all(rawHead)) throw util::CancelledError("client went away during interim response");
                continue;
            }

            http::BodySpec respSpec;
            try {
                respSpec = http::response_body_spec(resp, method);
            } catch (const util::ProtocolError& e) {
                throw util::UpstreamError(dialHost, dialPort, e.what());
            }
            bool streamed = false;
            auto onResponseOverflow = [&](std::string_view raw) {
                if (!streamed) {
                    streamed = true;
                    committed = true;
                    log_warn(fmt::format("{} {} -> {}: response {}; relayed without recording", method, url, code,
                                         util::BodyTooLargeError(cfg_.maxBodyBytes).what()));
                    if (!client.write_all(rawHead)) throw util::CancelledError("client went away during relay");
                }
                if (!raw.empty() && !client.write_all(raw)) throw util::CancelledError("client went away during relay");
            };
            http::BodyResult respBody;
            try {
                respBody = link.reader->read_body(respSpec, cfg_.maxBodyBytes, onResponseOverflow);
            } catch (const util::ProtocolError& e) {
                throw util::UpstreamError(dialHost, dialPort, e.what());
            }
            if (!upstream_keeps_alive(resp, respSpec)) link.reset();

            bool delivered = true;
            if (!streamed) {
                committed = true;
                delivered = client.write_all(rawHead) && client.write_all(respBody.raw);
                if (recording) store_.record(*identity, std::move(rec), to_recorded(resp, std::move(respBody.decoded)), ctx.tls);
            }
            if (!recording || streamed) log_debug(fmt::format("{} {} -> {} (not recorded)", method, url, code));
            if (!delivered || passthrough) return false;
            if (respSpec.framing == http::BodyFraming::until_close) return false;
            return keepAlive && !http::has_token(resp.headers, "connection", "close");
        }
    } catch (const util::UpstreamError& e) {
        link.reset();
        log_warn(fmt::format("{} {}: UpstreamError: {}", method, url, e.what()));
        if (committed) return false;
        if (!client.write_all(bad_gateway(e.what()))) return false;
        return keepAlive && !passthrough;
    }
}

flow::Flow FlowInterceptor::replay(const std::string& id) {
    auto flow = store_.get_flow(id);
    const auto& rq = flow.request;
    http::HeaderList headers = rq.headers;
    http::remove_header(headers, "Transfer-Encoding");
    http::remove_header(headers, "Content-Length");
    if (!rq.body.empty()) http::set_header(headers, "Content-Length", std::to_string(rq.body.size()));
    if (!http::find_header(headers, "host")) http::set_header(headers, "Host", http::format_authority(rq.scheme, rq.host, rq.port));
    http::set_header(headers, "Connection", "close");
    std::string wire = fmt::format("{} {} {}\r\n", rq.method, rq.target, rq.version) + http::serialize_headers(headers) + "\r\n" + rq.body;

    UpstreamLink link;
    connect_upstream(link, rq.host, rq.port, rq.scheme == "https", -1);
    if (!link.stream->write_all(wire)) throw util::UpstreamError(rq.host, rq.port, "write to upstream failed");
    for (;;) {
        auto next = next_response_head(*link.reader, rq.host, rq.port);
        const http::HttpResponse& resp = next.second;
        int code = resp.status_line.code;
        if (code == 101) throw util::UpstreamError(rq.host, rq.port, "upstream switched protocols on replay");
        if (code >= 100 && code < 200) continue;
        http::BodyResult body;
        try {
            auto spec = http::response_body_spec(resp, rq.method);
            body = link.reader->read_body(spec, cfg_.maxBodyBytes, [&](std::string_view){
                throw util::BodyTooLargeError(cfg_.maxBodyBytes);
            });
        } catch (const util::ProtocolError& e) {
            throw util::UpstreamError(rq.host, rq.port, e.what());
        }
        log_info(fmt::format("replayed {} {} -> {}", rq.method, flow::request_url(rq), code));
        return store_.record(flow.identity, rq, to_recorded(resp, std::move(body.decoded)), flow.tlsIntercepted);
    }
}
}
