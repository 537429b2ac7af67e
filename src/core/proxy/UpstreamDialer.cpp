#include "softmock/core/proxy/UpstreamDialer.h"
#include "softmock/core/net/UpstreamConnector.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>

namespace softmock::core::proxy {
std::unique_ptr<net::Stream> NetworkDialer::dial(const std::string& host, uint16_t port, bool tls) {
    std::string error;
    auto sock = net::UpstreamConnector::connect(host, port, connectTimeoutMs_, &error);
    if (!sock) throw util::UpstreamError(host, port, fmt::format("connect to {}:{} failed: {}", host, port, error));
    if (!sock->set_timeouts(ioTimeoutMs_, ioTimeoutMs_)) util::log_debug(fmt::format("cannot set socket timeouts for {}:{}", host, port));
    util::log_debug(fmt::format("upstream connected {}:{}{}", host, port, tls ? " (tls)" : ""));
    if (!tls) return std::make_unique<net::Socket>(std::move(*sock));
    if (!tls_) throw util::UpstreamError(host, port, "TLS is not available for upstream connections");
    return tls_->connect(std::make_shared<net::Socket>(std::move(*sock)), host, port);
}
}
