#include "softmock/core/flow/FlowFileStore.h"
#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/util/JsonText.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <sstream>

namespace softmock::core::flow {
using util::escape_json;
using util::b64_encode;
using util::JsonScalar;

namespace {
long long to_millis(std::chrono::system_clock::time_point tp) {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

using Fields = std::map<std::string, JsonScalar>;

const std::string* text(const Fields& f, const char* key) {
    auto it = f.find(key);
    if (it == f.end() || it->second.type != JsonScalar::Type::string) return nullptr;
    return &it->second.text;
}
std::optional<int64_t> number(const Fields& f, const char* key) {
    auto it = f.find(key);
    if (it == f.end() || it->second.type != JsonScalar::Type::number) return std::nullopt;
    return it->second.as_i64();
}
bool flag(const Fields& f, const char* key) {
    auto it = f.find(key);
    return it != f.end() && it->second.type == JsonScalar::Type::boolean && it->second.flag;
}
std::optional<std::string> body(const Fields& f, const char* key) {
    auto t = text(f, key);
    if (!t) return std::nullopt;
    return util::b64_decode(*t);
}
}

std::string flow_to_json_line(const Flow& f) {
    std::ostringstream o;
    const auto& rq = f.request;
    o << "{\"op\":\"put\",\"id\":\"" << f.identity.id << "\""
      << ",\"canonical\":\"" << escape_json(f.identity.canonical) << "\""
      << ",\"ver\":" << f.version
      << ",\"seq\":" << f.sequence
      << ",\"created_ms\":" << to_millis(f.createdAt)
      << ",\"last_seen_ms\":" << to_millis(f.lastSeenAt)
      << ",\"hits\":" << f.hits;
    if (f.tlsIntercepted) o << ",\"tls\":true";
    o << ",\"method\":\"" << escape_json(rq.method) << "\""
      << ",\"scheme\":\"" << escape_json(rq.scheme) << "\""
      << ",\"host\":\"" << escape_json(rq.host) << "\""
      << ",\"port\":" << rq.port
      << ",\"target\":\"" << escape_json(rq.target) << "\""
      << ",\"version\":\"" << escape_json(rq.version) << "\""
      << ",\"req_headers\":\"" << escape_json(http::serialize_headers(rq.headers)) << "\"";
    if (!rq.body.empty()) o << ",\"req_body_b64\":\"" << b64_encode(rq.body) << "\"";
    if (f.response) {
        const auto& rs = *f.response;
        o << ",\"resp_version\":\"" << escape_json(rs.version) << "\""
          << ",\"resp_status\":" << rs.status
          << ",\"resp_reason\":\"" << escape_json(rs.reason) << "\""
          << ",\"resp_headers\":\"" << escape_json(http::serialize_headers(rs.headers)) << "\""
          << ",\"resp_body_b64\":\"" << b64_encode(rs.body) << "\"";
    }
    if (f.responseOverride) {
        const auto& ov = *f.responseOverride;
        o << ",\"override\":true";
        if (ov.status) o << ",\"ovr_status\":" << *ov.status;
        if (ov.reason) o << ",\"ovr_reason\":\"" << escape_json(*ov.reason) << "\"";
        if (ov.headers) o << ",\"ovr_headers\":\"" << escape_json(http::serialize_headers(*ov.headers)) << "\"";
        if (ov.body) o << ",\"ovr_body_b64\":\"" << b64_encode(*ov.body) << "\"";
        if (f.overrideEnabled) o << ",\"ovr_enabled\":true";
    }
    o << "}";
    return o.str();
}

std::optional<Flow> flow_from_json_line(const std::string& line) {
    auto parsed = util::parse_flat_json_object(line);
    if (!parsed) return std::nullopt;
    const Fields& f = *parsed;
    auto op = text(f, "op");
    auto id = text(f, "id");
    auto canonical = text(f, "canonical");
    auto method = text(f, "method");
    auto host = text(f, "host");
    if (!op || *op != "put" || !id || !canonical || !method || !host) return std::nullopt;

    Flow flow;
    flow.identity.id = *id;
    flow.identity.canonical = *canonical;
    flow.version = static_cast<uint64_t>(number(f, "ver").value_or(0));
    flow.sequence = static_cast<uint64_t>(number(f, "seq").value_or(0));
    flow.createdAt = from_millis(number(f, "created_ms").value_or(0));
    flow.lastSeenAt = from_millis(number(f, "last_seen_ms").value_or(0));
    flow.hits = static_cast<uint64_t>(number(f, "hits").value_or(0));
    flow.tlsIntercepted = flag(f, "tls");

    auto& rq = flow.request;
    rq.method = *method;
    rq.host = *host;
    if (auto v = text(f, "scheme")) rq.scheme = *v;
    auto port = number(f, "port");
    if (!port || *port <= 0 || *port > 65535) return std::nullopt;
    rq.port = static_cast<uint16_t>(*port);
    if (auto v = text(f, "target")) rq.target = *v;
    if (auto v = text(f, "version")) rq.version = *v;
    if (auto v = text(f, "req_headers")) rq.headers = http::parse_header_block(*v);
    if (text(f, "req_body_b64")) {
        auto b = body(f, "req_body_b64");
        if (!b) return std::nullopt;
        rq.body = std::move(*b);
    }

    if (auto status = number(f, "resp_status")) {
        RecordedResponse rs;
        rs.status = static_cast<int>(*status);
        if (auto v = text(f, "resp_version")) rs.version = *v;
        if (auto v = text(f, "resp_reason")) rs.reason = *v;
        if (auto v = text(f, "resp_headers")) rs.headers = http::parse_header_block(*v);
        if (text(f, "resp_body_b64")) {
            auto b = body(f, "resp_body_b64");
            if (!b) return std::nullopt;
            rs.body = std::move(*b);
        }
        flow.response = std::move(rs);
    }

    if (flag(f, "override")) {
        ResponseOverride ov;
        if (auto s = number(f, "ovr_status")) ov.status = static_cast<int>(*s);
        if (auto v = text(f, "ovr_reason")) ov.reason = *v;
        if (auto v = text(f, "ovr_headers")) ov.headers = http::parse_header_block(*v);
        if (text(f, "ovr_body_b64")) {
            auto b = body(f, "ovr_body_b64");
            if (!b) return std::nullopt;
            ov.body = std::move(*b);
        }
        flow.responseOverride = std::move(ov);
        flow.overrideEnabled = flag(f, "ovr_enabled");
    }
    return flow;
}

FlowFileStore::FlowFileStore(std::string path) : path_(std::move(path)), ofs(path_, std::ios::app | std::ios::out) {
    if (!ofs.is_open()) util::log_error(fmt::format("cannot open flow journal {}", path_));
}

void FlowFileStore::on_flow(FlowEvent event, const Flow& flow) {
    if (event == FlowEvent::served_override) return; // hit counters are not journaled
    std::string line = event == FlowEvent::removed
        ? fmt::format("{{\"op\":\"del\",\"id\":\"{}\",\"ver\":{}}}", flow.identity.id, flow.version)
        : flow_to_json_line(flow);
    std::lock_guard lock(mu);
    if (!ofs.is_open()) return;
    ofs << line << '\n';
    ofs.flush();
    if (!ofs) {
        util::log_error(fmt::format("flow journal write failed ({}), further writes dropped", path_));
        ofs.close();
    }
}

std::size_t load_flows(const std::string& path, FlowStore& store) {
    std::ifstream in(path);
    if (!in.is_open()) return 0;
    // Observers may append out of commit order, so the highest version per id
    // wins; equal versions (and unversioned lines) keep file order.
    struct Latest { uint64_t version{0}; std::optional<Flow> flow; };
    std::map<std::string, Latest> latest;
    auto apply = [&latest](const std::string& id, uint64_t version, std::optional<Flow> flow) {
        auto it = latest.find(id);
        if (it != latest.end() && version < it->second.version) return;
        latest[id] = Latest{ version, std::move(flow) };
    };
    std::string line;
    std::size_t lineNo = 0, skipped = 0;
    uint64_t maxVersion = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        if (auto flow = flow_from_json_line(line)) {
            auto key = flow->identity.id;
            auto version = flow->version;
            maxVersion = std::max(maxVersion, version);
            apply(key, version, std::move(flow));
            continue;
        }
        auto fields = util::parse_flat_json_object(line);
        auto op = fields ? text(*fields, "op") : nullptr;
        auto id = fields ? text(*fields, "id") : nullptr;
        if (op && *op == "del" && id) {
            auto version = static_cast<uint64_t>(number(*fields, "ver").value_or(0));
            maxVersion = std::max(maxVersion, version);
            apply(*id, version, std::nullopt);
            continue;
        }
        ++skipped;
        util::log_warn(fmt::format("flow journal {}:{} malformed record skipped", path, lineNo));
    }
    std::size_t restored = 0;
    for (auto& kv : latest) {
        if (!kv.second.flow) continue;
        store.restore(std::move(*kv.second.flow));
        ++restored;
    }
    // tombstones outrank anything restored; new writes must outrank them
    store.advance_version(maxVersion);
    util::log_info(fmt::format("restored {} flows from {} ({} malformed lines)", restored, path, skipped));
    return restored;
}

std::shared_ptr<FlowFileStore> make_flow_file_store(FlowDispatcher& d, const std::string& path) {
    auto ptr = std::make_shared<FlowFileStore>(path);
    d.add(ptr);
    return ptr;
}
}
