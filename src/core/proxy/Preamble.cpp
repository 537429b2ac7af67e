#include "softmock/core/proxy/Preamble.h"
#include "softmock/core/http/HostUtil.h"

namespace softmock::core::proxy {
Preamble classify_preamble(std::string_view first_bytes) {
    if (first_bytes.empty()) return Preamble::unknown;
    unsigned char c = static_cast<unsigned char>(first_bytes.front());
    if (c == 0x16) return Preamble::tls;
    if (c >= 'A' && c <= 'Z') return Preamble::http;
    return Preamble::unknown;
}

std::optional<Preamble> sniff(net::Socket& sock, int timeout_ms) {
    if (net::wait_readable(sock, -1, timeout_ms) != net::WaitResult::ready) return std::nullopt;
    char first = 0;
    auto n = sock.peek_some(&first, 1);
    if (!n || *n == 0) return std::nullopt;
    return classify_preamble(std::string_view(&first, 1));
}

std::optional<ConnectTarget> parse_connect_target(const http::HttpRequest& req) {
    if (req.request_line.method != "CONNECT") return std::nullopt;
    const auto& target = req.request_line.target;
    // authority-form only; the port is mandatory
    if (target.empty() || target.back() == ']' || target.find(':') == std::string::npos) return std::nullopt;
    auto hp = http::split_authority(target, 0);
    if (!hp || hp->second == 0) return std::nullopt;
    return ConnectTarget{ hp->first, hp->second };
}
}
