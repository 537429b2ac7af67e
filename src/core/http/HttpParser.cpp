#include "softmock/core/http/HttpParser.h"
#include <string_view>
#include <algorithm>
#include <cctype>

namespace softmock::core::http {
namespace {
bool is_token_char(char c) {
    return std::isalnum((unsigned char)c) || std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}
std::string_view trim(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t' || v.back() == '\r')) v.remove_suffix(1);
    return v;
}
void append_header_line(HeaderList& out, std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return;
    std::string name(line.substr(0, colon));
    std::string value(trim(line.substr(colon + 1)));
    out.push_back(HttpHeader{ std::move(name), std::move(value) });
}
}

std::optional<HttpRequestLine> HttpParser::parse_request_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos || first_space == 0) return std::nullopt;
    auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) return std::nullopt;
    HttpRequestLine rl;
    rl.method = std::string(line.substr(0, first_space));
    rl.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    rl.version = std::string(line.substr(second_space + 1));
    if (!std::all_of(rl.method.begin(), rl.method.end(), is_token_char)) return std::nullopt;
    if (rl.target.empty() || rl.version.rfind("HTTP/", 0) != 0) return std::nullopt;
    return rl;
}

std::optional<HttpStatusLine> HttpParser::parse_status_line(std::string_view line) {
    if (line.rfind("HTTP/", 0) != 0) return std::nullopt;
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    HttpStatusLine sl;
    sl.version = std::string(line.substr(0, first_space));
    auto rest = line.substr(first_space + 1);
    if (rest.size() < 3) return std::nullopt;
    int code = 0;
    for (int i = 0; i < 3; ++i) {
        if (!std::isdigit((unsigned char)rest[i])) return std::nullopt;
        code = code * 10 + (rest[i] - '0');
    }
    if (rest.size() > 3 && rest[3] != ' ') return std::nullopt;
    sl.code = code;
    sl.reason = rest.size() > 4 ? std::string(rest.substr(4)) : std::string();
    return sl;
}

HeaderList parse_header_block(std::string_view head) {
    HeaderList out;
    size_t pos = 0;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        auto line = head.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (line.empty()) break;
        append_header_line(out, line);
        if (next == std::string_view::npos) break;
        pos = next + 2;
    }
    return out;
}

std::optional<HttpRequest> HttpParser::parse_request(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto rl_opt = parse_request_line(head.substr(0, first_eol));
    if (!rl_opt) return std::nullopt;
    HttpRequest req; req.request_line = std::move(*rl_opt);
    if (first_eol != std::string_view::npos) req.headers = parse_header_block(head.substr(first_eol + 2));
    return req;
}

std::optional<HttpResponse> HttpParser::parse_response(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto sl = parse_status_line(head.substr(0, first_eol));
    if (!sl) return std::nullopt;
    HttpResponse resp; resp.status_line = std::move(*sl);
    if (first_eol != std::string_view::npos) resp.headers = parse_header_block(head.substr(first_eol + 2));
    return resp;
}

std::string serialize_headers(const HeaderList& headers) {
    std::string out;
    for (auto& h : headers) {
        out += h.name;
        out += ": ";
        out += h.value;
        out += "\r\n";
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

std::optional<std::string> find_header(const HeaderList& headers, std::string_view name) {
    for (auto& h : headers) if (iequals(h.name, name)) return h.value;
    return std::nullopt;
}

bool has_token(const HeaderList& headers, std::string_view name, std::string_view token) {
    for (auto& h : headers) {
        if (!iequals(h.name, name)) continue;
        std::string_view v = h.value;
        size_t pos = 0;
        while (pos <= v.size()) {
            auto comma = v.find(',', pos);
            auto item = trim(v.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
            if (iequals(item, token)) return true;
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
    }
    return false;
}

void set_header(HeaderList& headers, std::string_view name, std::string value) {
    auto it = std::find_if(headers.begin(), headers.end(), [&](const HttpHeader& h){ return iequals(h.name, name); });
    if (it == headers.end()) { headers.push_back(HttpHeader{ std::string(name), std::move(value) }); return; }
    it->value = std::move(value);
    headers.erase(std::remove_if(std::next(it), headers.end(), [&](const HttpHeader& h){ return iequals(h.name, name); }), headers.end());
}

void remove_header(HeaderList& headers, std::string_view name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const HttpHeader& h){ return iequals(h.name, name); }), headers.end());
}
}
