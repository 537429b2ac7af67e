#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include "softmock/core/http/HttpParser.h"

namespace softmock::core::http {
struct HostTarget {
    std::string scheme{"http"};
    std::string host;
    uint16_t port{80};
    std::string path; // origin-form: path plus optional ?query
};

uint16_t default_port(std::string_view scheme);
// host[:port] or [v6]:port; the host is returned without brackets.
std::optional<std::pair<std::string, uint16_t>> split_authority(std::string_view authority, uint16_t default_port);
// http://host[:port]/path?query (https as well). Fragments are dropped.
std::optional<HostTarget> split_absolute_url(std::string_view url);
// Target of a proxied request: the absolute-form request target when present,
// otherwise the Host header interpreted under `scheme`.
std::optional<HostTarget> extract_host_target(const HttpRequest& req, std::string_view scheme = "http");
// "host" or "host:port" when the port is not the scheme default; IPv6 hosts are bracketed.
std::string format_authority(std::string_view scheme, std::string_view host, uint16_t port);
}
