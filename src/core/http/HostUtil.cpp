#include "softmock/core/http/HostUtil.h"
#include <algorithm>
#include <cctype>

namespace softmock::core::http {
static std::string to_lower(std::string v) { std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); }); return v; }

uint16_t default_port(std::string_view scheme) { return scheme == "https" ? 443 : 80; }

std::optional<std::pair<std::string, uint16_t>> split_authority(std::string_view authority, uint16_t dflt) {
    if (authority.empty()) return std::nullopt;
    std::string host;
    std::string_view rest;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = std::string(authority.substr(1, close - 1));
        rest = authority.substr(close + 1);
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos && authority.find(':') != colon) {
            // bare IPv6 literal without port
            return std::make_pair(std::string(authority), dflt);
        }
        host = std::string(authority.substr(0, colon));
        rest = colon == std::string_view::npos ? std::string_view() : authority.substr(colon);
    }
    if (host.empty()) return std::nullopt;
    uint16_t port = dflt;
    if (!rest.empty()) {
        if (rest.front() != ':' || rest.size() < 2 || rest.size() > 6) return std::nullopt;
        unsigned long p = 0;
        for (char c : rest.substr(1)) {
            if (!std::isdigit((unsigned char)c)) return std::nullopt;
            p = p * 10 + unsigned(c - '0');
        }
        if (p == 0 || p > 65535) return std::nullopt;
        port = static_cast<uint16_t>(p);
    }
    return std::make_pair(to_lower(std::move(host)), port);
}

std::optional<HostTarget> split_absolute_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;
    HostTarget out;
    out.scheme = to_lower(std::string(url.substr(0, scheme_end)));
    if (out.scheme != "http" && out.scheme != "https") return std::nullopt;
    auto after = scheme_end + 3;
    auto slash = url.find_first_of("/?#", after);
    auto authority = url.substr(after, slash == std::string_view::npos ? std::string_view::npos : slash - after);
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) authority = authority.substr(at + 1);
    auto hp = split_authority(authority, default_port(out.scheme));
    if (!hp) return std::nullopt;
    out.host = hp->first; out.port = hp->second;
    std::string path = slash == std::string_view::npos ? std::string("/") : std::string(url.substr(slash));
    auto hash = path.find('#');
    if (hash != std::string::npos) path.erase(hash);
    if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');
    out.path = std::move(path);
    return out;
}

std::optional<HostTarget> extract_host_target(const HttpRequest& req, std::string_view scheme) {
    const std::string& target = req.request_line.target;
    if (target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0 ||
        target.rfind("HTTP://", 0) == 0 || target.rfind("HTTPS://", 0) == 0) {
        return split_absolute_url(target);
    }
    auto host_header = find_header(req.headers, "host");
    if (!host_header || host_header->empty()) return std::nullopt;
    HostTarget out;
    out.scheme = std::string(scheme);
    auto hp = split_authority(*host_header, default_port(scheme));
    if (!hp) return std::nullopt;
    out.host = hp->first; out.port = hp->second;
    out.path = target.empty() || target.front() != '/' ? "/" + target : target;
    auto hash = out.path.find('#');
    if (hash != std::string::npos) out.path.erase(hash);
    return out;
}

std::string format_authority(std::string_view scheme, std::string_view host, uint16_t port) {
    std::string out;
    bool v6 = host.find(':') != std::string_view::npos;
    if (v6) out += '[';
    out += host;
    if (v6) out += ']';
    if (port != default_port(scheme)) { out += ':'; out += std::to_string(port); }
    return out;
}
}
