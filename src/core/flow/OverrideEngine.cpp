#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/util/Error.h"
#include <fmt/format.h>

namespace softmock::core::flow {
namespace {
const char* default_reason(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 418: return "I'm a teapot";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}
}

ResponseOverride merge_override(const ResponseOverride& prior, const ResponseOverride& edit) {
    ResponseOverride out = prior;
    if (edit.status) out.status = edit.status;
    if (edit.reason) out.reason = edit.reason;
    if (edit.headers) out.headers = edit.headers;
    if (edit.body) out.body = edit.body;
    return out;
}

RecordedResponse materialize_response(const Flow& flow) {
    RecordedResponse out = flow.response ? *flow.response : RecordedResponse{};
    if (flow.responseOverride) {
        const auto& o = *flow.responseOverride;
        if (o.status) {
            out.status = *o.status;
            // the live reason phrase belongs to the live status
            if (!o.reason && (!flow.response || flow.response->status != *o.status)) out.reason = default_reason(*o.status);
        }
        if (o.reason) out.reason = *o.reason;
        if (o.headers) out.headers = *o.headers;
        if (o.body) {
            out.body = *o.body;
            if (!o.headers) http::remove_header(out.headers, "Content-Encoding");
        }
    }
    http::remove_header(out.headers, "Transfer-Encoding");
    if (out.status < 200 || out.status == 204 || out.status == 304) {
        http::remove_header(out.headers, "Content-Length");
        out.body.clear();
    } else {
        http::set_header(out.headers, "Content-Length", std::to_string(out.body.size()));
    }
    return out;
}

std::string serialize_response(const RecordedResponse& resp, bool include_body) {
    std::string out = fmt::format("{} {} {}\r\n", resp.version, resp.status, resp.reason);
    out += http::serialize_headers(resp.headers);
    out += "\r\n";
    if (include_body) out += resp.body;
    return out;
}

Flow OverrideEngine::set_override(const std::string& id, const ResponseOverride& partial) {
    // a served override is the final answer, so interim 1xx codes are refused
    if (partial.status && (*partial.status < 200 || *partial.status > 599))
        throw util::InvalidOverrideError(fmt::format("status {} outside 200-599", *partial.status));
    return store_.modify(id, [&](Flow& f){
        f.responseOverride = merge_override(f.responseOverride.value_or(ResponseOverride{}), partial);
        f.overrideEnabled = true;
    });
}

Flow OverrideEngine::clear_override(const std::string& id) {
    return store_.modify(id, [](Flow& f){
        f.responseOverride.reset();
        f.overrideEnabled = false;
    });
}

Flow OverrideEngine::set_override_enabled(const std::string& id, bool enabled) {
    return store_.modify(id, [&](Flow& f){ f.overrideEnabled = enabled && f.responseOverride.has_value(); });
}
}
