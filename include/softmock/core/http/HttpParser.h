#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace softmock::core::http {
struct HttpHeader { std::string name; std::string value; };
using HeaderList = std::vector<HttpHeader>;
struct HttpRequestLine { std::string method; std::string target; std::string version; };
struct HttpRequest { HttpRequestLine request_line; HeaderList headers; };
struct HttpStatusLine { std::string version; int code{0}; std::string reason; };
struct HttpResponse { HttpStatusLine status_line; HeaderList headers; };

class HttpParser {
public:
    std::optional<HttpRequestLine> parse_request_line(std::string_view line);
    std::optional<HttpRequest> parse_request(std::string_view data);
    std::optional<HttpStatusLine> parse_status_line(std::string_view line);
    std::optional<HttpResponse> parse_response(std::string_view data);
};

// "Name: value" lines separated by CRLF; malformed lines are skipped.
HeaderList parse_header_block(std::string_view block);
std::string serialize_headers(const HeaderList& headers);

bool iequals(std::string_view a, std::string_view b);
std::optional<std::string> find_header(const HeaderList& headers, std::string_view name);
bool has_token(const HeaderList& headers, std::string_view name, std::string_view token);
void set_header(HeaderList& headers, std::string_view name, std::string value);
void remove_header(HeaderList& headers, std::string_view name);
}
