#include "softmock/core/http/HttpParser.h"
#include "softmock/core/http/HostUtil.h"
#include <cassert>
#include <string>

using namespace softmock::core::http;

int main() {
    HttpParser p;
    auto rl = p.parse_request_line("GET /index.html HTTP/1.1");
    assert(rl.has_value());
    assert(rl->method == "GET");
    assert(rl->target == "/index.html");
    assert(rl->version == "HTTP/1.1");
    assert(!p.parse_request_line("GET /index.html").has_value());
    assert(!p.parse_request_line("G(T / HTTP/1.1").has_value());
    assert(!p.parse_request_line("GET / FTP/1.0").has_value());

    std::string full = "GET /path HTTP/1.1\r\nHost: example.com\r\nUser-Agent: X\r\nX-Dup: a\r\nx-dup: b\r\n\r\n";
    auto req = p.parse_request(full);
    assert(req.has_value());
    assert(req->headers.size() == 4);
    assert(req->headers[2].value == "a" && req->headers[3].value == "b"); // order and duplicates kept
    auto host_target = extract_host_target(*req);
    assert(host_target.has_value());
    assert(host_target->host == "example.com");
    assert(host_target->port == 80);
    assert(host_target->path == "/path");

    std::string abs_req = "GET http://Example.NET/abc?q=1#frag HTTP/1.1\r\nHost: example.net\r\n\r\n";
    auto req2 = p.parse_request(abs_req);
    assert(req2.has_value());
    auto host_target2 = extract_host_target(*req2);
    assert(host_target2.has_value());
    assert(host_target2->host == "example.net");
    assert(host_target2->path == "/abc?q=1");

    std::string host_port_req = "GET /x HTTP/1.1\r\nHost: example.org:8080\r\n\r\n";
    auto req3 = p.parse_request(host_port_req);
    assert(req3.has_value());
    auto host_target3 = extract_host_target(*req3);
    assert(host_target3.has_value());
    assert(host_target3->host == "example.org");
    assert(host_target3->port == 8080);
    assert(host_target3->path == "/x");

    auto https_target = extract_host_target(*p.parse_request("GET / HTTP/1.1\r\nHost: secure.test\r\n\r\n"), "https");
    assert(https_target && https_target->port == 443 && https_target->scheme == "https");
    assert(!extract_host_target(*p.parse_request("GET / HTTP/1.1\r\n\r\n")).has_value());

    auto v6 = split_authority("[::1]:8443", 443);
    assert(v6 && v6->first == "::1" && v6->second == 8443);
    assert(!split_authority("host:99999", 80).has_value());
    assert(!split_authority("host:", 80).has_value());
    assert(format_authority("http", "example.com", 80) == "example.com");
    assert(format_authority("https", "example.com", 8443) == "example.com:8443");
    assert(format_authority("http", "::1", 8080) == "[::1]:8080");

    auto resp = p.parse_response("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
    assert(resp && resp->status_line.code == 404 && resp->status_line.reason == "Not Found");
    assert(!p.parse_response("HTTP/1.1 4x4 Nope\r\n\r\n").has_value());
    auto bare = p.parse_status_line("HTTP/1.1 204");
    assert(bare && bare->code == 204 && bare->reason.empty());

    HeaderList h = parse_header_block("Connection: keep-alive, Upgrade\r\nContent-Length: 5\r\n");
    assert(has_token(h, "connection", "upgrade"));
    assert(!has_token(h, "connection", "close"));
    set_header(h, "content-length", "7");
    assert(find_header(h, "Content-Length") == std::string("7"));
    remove_header(h, "CONNECTION");
    assert(h.size() == 1);
    assert(serialize_headers(h) == "Content-Length: 7\r\n");
    return 0;
}
