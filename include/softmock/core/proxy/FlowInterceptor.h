#pragma once
#include <memory>
#include <string>
#include <optional>
#include <cstdint>
#include "softmock/core/net/Stream.h"
#include "softmock/core/http/HttpParser.h"
#include "softmock/core/http/MessageReader.h"
#include "softmock/core/http/HostUtil.h"
#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/proxy/Config.h"
#include "softmock/core/proxy/InterceptPolicy.h"
#include "softmock/core/proxy/UpstreamDialer.h"
#include "softmock/core/tls/CertificateAuthority.h"

namespace softmock::core::proxy {
// What the session learned about a client stream before handing it over.
struct ConnectionContext {
    std::string scheme { "http" };
    bool tls { false };             // requests arrive over a terminated TLS session
    std::string upstreamHost;       // CONNECT / SNI target; empty for plain proxy requests
    uint16_t upstreamPort { 0 };
    int cancelFd { -1 };            // client descriptor watched for hang-up while waiting upstream
    std::string peer;               // for log lines
};

// Per-request pipeline: parse, identify, serve from an override or forward
// upstream, record. One request at a time per client stream.
class FlowInterceptor {
public:
    FlowInterceptor(const Config& cfg, flow::FlowStore& store, UpstreamDialer& dialer,
                    const InterceptPolicy& record_policy, std::shared_ptr<tls::CertificateAuthority> ca = {});

    // Serves requests from `client` until either side ends the connection.
    // `first_head`, when given, is a request head already read from `reader`.
    // Throws ProtocolError for malformed client input and CancelledError when
    // the client disappears mid-exchange.
    void serve(net::Stream& client, http::MessageReader& reader, const ConnectionContext& ctx,
               std::optional<std::string> first_head = std::nullopt);

    // Sends the stored request of flow `id` upstream again and records the
    // live answer. The override, if any, is kept. Throws UnknownFlowError,
    // UpstreamError or BodyTooLargeError.
    flow::Flow replay(const std::string& id);

    static std::string bad_gateway(const std::string& why);
private:
    struct UpstreamLink;
    bool handle(net::Stream& client, http::MessageReader& reader, const ConnectionContext& ctx,
                const std::string& head, UpstreamLink& link);
    bool serve_local_ca(net::Stream& client, const http::HostTarget& target, bool head_only);
    UpstreamLink& connect_upstream(UpstreamLink& link, const std::string& host, uint16_t port, bool tls, int cancel_fd);

    Config cfg_;
    flow::FlowStore& store_;
    UpstreamDialer& dialer_;
    const InterceptPolicy& recordPolicy_;
    std::shared_ptr<tls::CertificateAuthority> ca_;
};
}
