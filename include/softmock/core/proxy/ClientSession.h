#pragma once
#include <memory>
#include <string>
#include "softmock/core/net/Socket.h"
#include "softmock/core/http/HttpParser.h"
#include "softmock/core/http/MessageReader.h"
#include "softmock/core/proxy/Config.h"
#include "softmock/core/proxy/FlowInterceptor.h"
#include "softmock/core/proxy/InterceptPolicy.h"
#include "softmock/core/proxy/UpstreamDialer.h"
#include "softmock/core/tls/TlsTerminator.h"

namespace softmock::core::proxy {
// Collaborators shared by every session of one server.
struct SessionServices {
    const Config* config { nullptr };
    FlowInterceptor* interceptor { nullptr };
    UpstreamDialer* dialer { nullptr };
    tls::TlsTerminator* terminator { nullptr };
    const InterceptPolicy* interceptPolicy { nullptr };
};

// One accepted client connection: detects the protocol, sets up tunnels and
// TLS, then hands the request stream to the interceptor. All errors end here.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    ClientSession(std::shared_ptr<net::Socket> socket, SessionServices services, std::string peer);
    // Runs to completion on the calling thread and closes the socket.
    void run();
private:
    void process();
    void handle_connect(http::MessageReader& reader, const http::HttpRequest& req);
    void terminate_tls(const std::string& host_hint, const std::string& upstream_host, uint16_t upstream_port);
    void blind_tunnel(const std::string& host, uint16_t port, bool reply_established);

    std::shared_ptr<net::Socket> sock;
    SessionServices svc;
    std::string peer;
};
}
