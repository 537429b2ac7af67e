#include "softmock/core/flow/FlowIdentity.h"
#include "softmock/core/http/HostUtil.h"
#include "softmock/core/util/Digest.h"
#include <algorithm>
#include <cctype>

namespace softmock::core::flow {
namespace {
std::string lowered(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    return v;
}
std::string_view param_name(std::string_view param) {
    auto eq = param.find('=');
    return eq == std::string_view::npos ? param : param.substr(0, eq);
}
}

std::string normalize_query(std::string_view query, const std::vector<std::string>& ignored) {
    std::vector<std::string_view> params;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        auto piece = query.substr(start, amp == std::string_view::npos ? std::string_view::npos : amp - start);
        if (!piece.empty()) {
            auto name = param_name(piece);
            bool drop = std::any_of(ignored.begin(), ignored.end(), [&](const std::string& n){ return n == name; });
            if (!drop) params.push_back(piece);
        }
        if (amp == std::string_view::npos) break;
        start = amp + 1;
    }
    std::stable_sort(params.begin(), params.end(), [](std::string_view a, std::string_view b){
        return param_name(a) < param_name(b);
    });
    std::string out;
    for (auto p : params) {
        if (!out.empty()) out.push_back('&');
        out.append(p);
    }
    return out;
}

FlowIdentity compute_identity(const RecordedRequest& req, const IdentityOptions& options) {
    std::string scheme = lowered(req.scheme);
    std::string host = lowered(req.host);
    std::string_view target = req.target;
    auto hash = target.find('#');
    if (hash != std::string_view::npos) target = target.substr(0, hash);
    auto qmark = target.find('?');
    std::string path(target.substr(0, qmark));
    if (path.empty()) path = "/";

    FlowIdentity id;
    id.canonical = req.method + " " + scheme + "://" + http::format_authority(scheme, host, req.port) + path;
    if (qmark != std::string_view::npos) {
        auto query = normalize_query(target.substr(qmark + 1), options.ignoredQueryParams);
        if (!query.empty()) id.canonical += "?" + query;
    }
    if (options.includeBodyHash) id.canonical += " #body=" + util::sha256_hex(req.body);
    id.id = util::sha256_hex(id.canonical);
    return id;
}
}
