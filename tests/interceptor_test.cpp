#include "softmock/core/proxy/FlowInterceptor.h"
#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/net/Socket.h"
#include "softmock/core/tls/CertificateAuthority.h"
#include "softmock/core/util/Error.h"
#include "TestStreams.h"
#include <sys/socket.h>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace softmock::core;
using namespace softmock::core::proxy;
using softmock::test::MemoryStream;
using softmock::test::StubDialer;
using softmock::test::ok_response;
using softmock::test::split_responses;

namespace {
std::string exchange(FlowInterceptor& icpt, const std::string& input, const ConnectionContext& ctx = {}) {
    MemoryStream client(input);
    http::MessageReader reader(client);
    icpt.serve(client, reader, ctx);
    return client.out;
}

const char* kIpRequest = "GET http://httpbin.org/ip HTTP/1.1\r\nHost: httpbin.org\r\nProxy-Connection: keep-alive\r\n\r\n";

struct Seen {
    std::mutex mu;
    std::vector<std::string> targets;
    std::vector<std::string> bodies;
    std::vector<http::HeaderList> headers;
    void add(const http::HttpRequest& r, const std::string& body) {
        std::lock_guard<std::mutex> lk(mu);
        targets.push_back(r.request_line.target);
        bodies.push_back(body);
        headers.push_back(r.headers);
    }
};

std::pair<net::Socket, net::Socket> socket_pair() {
    int fds[2];
    int rc = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(rc == 0);
    return { net::Socket(fds[0]), net::Socket(fds[1]) };
}

// Hosts named "stall.*" get a real socket whose far end never answers;
// everything else goes to the scripted upstream.
class StallingDialer : public UpstreamDialer {
public:
    explicit StallingDialer(StubDialer& fallback) : fallback_(fallback) {}
    std::unique_ptr<net::Stream> dial(const std::string& host, uint16_t port, bool tls) override {
        if (host.compare(0, 6, "stall.") != 0) return fallback_.dial(host, port, tls);
        auto pair = socket_pair();
        std::lock_guard<std::mutex> lk(mu);
        silent.push_back(std::move(pair.second));
        return std::make_unique<net::Socket>(std::move(pair.first));
    }
    std::mutex mu;
    std::vector<net::Socket> silent;
private:
    StubDialer& fallback_;
};

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}
}

int main() {
    // record, then serve the override without contacting upstream
    {
        Seen seen;
        StubDialer dialer([&](const http::HttpRequest& r, const std::string& b){
            seen.add(r, b);
            return ok_response("{\"origin\":\"203.0.113.7\"}");
        });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);

        auto first = split_responses(::exchange(icpt, kIpRequest));
        assert(first.size() == 1 && first[0].first.status_line.code == 200);
        assert(first[0].second == "{\"origin\":\"203.0.113.7\"}");
        assert(store.size() == 1);
        assert(dialer.requests == 1);
        assert(dialer.dialed()[0] == "httpbin.org:80:tcp");
        // origin-form towards upstream, proxy headers stripped
        assert(seen.targets[0] == "/ip");
        assert(!http::find_header(seen.headers[0], "Proxy-Connection"));

        auto second = split_responses(::exchange(icpt, kIpRequest));
        assert(second[0].second == first[0].second);
        assert(dialer.requests == 2 && store.size() == 1);

        auto id = store.list_flows()[0].id;
        flow::OverrideEngine engine(store);
        flow::ResponseOverride o; o.body = "{\"origin\":\"1.2.3.4\"}";
        engine.set_override(id, o);

        auto third = split_responses(::exchange(icpt, kIpRequest));
        assert(third.size() == 1 && third[0].first.status_line.code == 200);
        assert(third[0].second == "{\"origin\":\"1.2.3.4\"}");
        assert(http::find_header(third[0].first.headers, "Content-Length") == std::to_string(o.body->size()));
        assert(dialer.requests == 2); // upstream never contacted
        assert(store.get_flow(id).hits == 3);

        engine.clear_override(id);
        auto fourth = split_responses(::exchange(icpt, kIpRequest));
        assert(fourth[0].second == "{\"origin\":\"203.0.113.7\"}");
        assert(dialer.requests == 3);
    }

    // pipelined requests on one connection are answered in order over one upstream link
    {
        StubDialer dialer([](const http::HttpRequest& r, const std::string&){ return ok_response("resp" + r.request_line.target); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        std::string in =
            "GET /a HTTP/1.1\r\nHost: pipe.test\r\n\r\n"
            "POST /b HTTP/1.1\r\nHost: pipe.test\r\nContent-Length: 3\r\n\r\nxyz"
            "GET /c HTTP/1.1\r\nHost: pipe.test\r\n\r\n";
        auto out = split_responses(::exchange(icpt, in));
        assert(out.size() == 3);
        assert(out[0].second == "resp/a" && out[1].second == "resp/b" && out[2].second == "resp/c");
        assert(dialer.dials == 1);
        assert(store.size() == 3);
        auto flows = store.list_flows();
        assert(flows[1].method == "POST" && flows[1].url == "http://pipe.test/b");
        assert(store.get_flow(flows[1].id).request.body == "xyz");
    }

    // unreachable upstream: 502, nothing recorded, connection stays usable
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){ return ok_response("x"); });
        dialer.refuse = true;
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto out = split_responses(::exchange(icpt, std::string(kIpRequest) + kIpRequest));
        assert(out.size() == 2);
        assert(out[0].first.status_line.code == 502 && out[1].first.status_line.code == 502);
        assert(out[0].second.find("connection refused") != std::string::npos);
        assert(store.size() == 0);
    }

    // malformed upstream answer is a 502 as well
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){ return std::string("SMTP ready\r\n\r\n"); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto out = split_responses(::exchange(icpt, kIpRequest));
        assert(out.size() == 1 && out[0].first.status_line.code == 502);
        assert(store.size() == 0);
    }
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){
            return std::string("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Length: 4\r\n\r\nokok");
        });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto out = split_responses(::exchange(icpt, kIpRequest));
        assert(out.size() == 1 && out[0].first.status_line.code == 502);
        assert(store.size() == 0);
    }

    // chunked upstream answer: relayed as received, recorded decoded, override re-framed
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){
            return std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
        });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto raw = ::exchange(icpt, "GET http://chunky.test/ HTTP/1.1\r\nHost: chunky.test\r\n\r\n");
        assert(raw.find("5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n") != std::string::npos);
        auto id = store.list_flows()[0].id;
        assert(store.get_flow(id).response->body == "hello world");
        flow::OverrideEngine engine(store);
        flow::ResponseOverride o; o.status = 503; o.body = "down";
        engine.set_override(id, o);
        auto raw2 = ::exchange(icpt, "GET http://chunky.test/ HTTP/1.1\r\nHost: chunky.test\r\n\r\n");
        assert(raw2.find("Transfer-Encoding") == std::string::npos);
        auto out = split_responses(raw2);
        assert(out[0].first.status_line.code == 503 && out[0].second == "down");
    }

    // bodies beyond the cap pass through unrecorded
    {
        Seen seen;
        StubDialer dialer([&](const http::HttpRequest& r, const std::string& b){
            seen.add(r, b);
            return ok_response(std::string(20, 'R'));
        });
        Config cfg;
        cfg.maxBodyBytes = 8;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);

        auto big = split_responses(::exchange(icpt, "GET http://big.test/ HTTP/1.1\r\nHost: big.test\r\n\r\n"));
        assert(big.size() == 1 && big[0].second == std::string(20, 'R'));
        assert(store.size() == 0);

        std::string upload = std::string("POST http://big.test/up HTTP/1.1\r\nHost: big.test\r\nContent-Length: 16\r\n\r\n") +
                             std::string(16, 'U') + "GET http://big.test/next HTTP/1.1\r\nHost: big.test\r\n\r\n";
        auto up = split_responses(::exchange(icpt, upload));
        assert(up.size() == 1); // pass-through ends the connection
        assert(seen.bodies.back() == std::string(16, 'U'));
        assert(store.size() == 0);
    }

    // Expect: 100-continue is answered locally and not forwarded
    {
        Seen seen;
        StubDialer dialer([&](const http::HttpRequest& r, const std::string& b){ seen.add(r, b); return ok_response("ok"); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto out = split_responses(::exchange(icpt,
            "PUT http://up.test/f HTTP/1.1\r\nHost: up.test\r\nExpect: 100-continue\r\nContent-Length: 4\r\n\r\ndata"));
        assert(out.size() == 2);
        assert(out[0].first.status_line.code == 100 && out[1].first.status_line.code == 200);
        assert(!http::find_header(seen.headers[0], "Expect"));
        assert(seen.bodies[0] == "data");
    }

    // record policy: denied hosts are forwarded but never recorded or overridden
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){ return ok_response("p"); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        rec.set_lists({}, { "*.private" });
        FlowInterceptor icpt(cfg, store, dialer, rec);
        auto out = split_responses(::exchange(icpt, "GET http://db.private/ HTTP/1.1\r\nHost: db.private\r\n\r\n"));
        assert(out[0].second == "p" && store.size() == 0);
        ::exchange(icpt, "GET http://open.test/ HTTP/1.1\r\nHost: open.test\r\n\r\n");
        assert(store.size() == 1);
    }

    // requests inside a terminated tunnel go to the tunnel target over TLS
    {
        StubDialer dialer([](const http::HttpRequest&, const std::string&){ return ok_response("secure"); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        ConnectionContext ctx;
        ctx.scheme = "https"; ctx.tls = true; ctx.upstreamHost = "secure.test"; ctx.upstreamPort = 8443;
        auto out = split_responses(::exchange(icpt, "GET /account?b=2&a=1 HTTP/1.1\r\nHost: secure.test:8443\r\n\r\n", ctx));
        assert(out[0].second == "secure");
        assert(dialer.dialed()[0] == "secure.test:8443:tls");
        auto f = store.get_flow(store.list_flows()[0].id);
        assert(f.tlsIntercepted);
        assert(f.identity.canonical == "GET https://secure.test:8443/account?a=1&b=2");
    }

    // malformed client input ends only that connection; other threads carry on
    {
        StubDialer dialer([](const http::HttpRequest& r, const std::string&){
            if (http::find_header(r.headers, "host") == "broken.test") return std::string("garbage\r\n\r\n");
            return ok_response("fine");
        });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        std::atomic<int> ok{0}, protocolErrors{0}, gateways{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < 12; ++i) {
            ts.emplace_back([&, i]{
                std::string in;
                if (i % 4 == 0) in = "garbage\r\n\r\n";
                else if (i % 4 == 1) in = "GET http://broken.test/ HTTP/1.1\r\nHost: broken.test\r\n\r\n";
                else in = "GET http://host" + std::to_string(i) + ".test/ HTTP/1.1\r\nHost: host" + std::to_string(i) + ".test\r\n\r\n";
                try {
                    auto out = split_responses(::exchange(icpt, in));
                    if (!out.empty() && out[0].first.status_line.code == 200) ++ok;
                    if (!out.empty() && out[0].first.status_line.code == 502) ++gateways;
                } catch (const util::ProtocolError&) {
                    ++protocolErrors;
                }
            });
        }
        for (auto& t : ts) t.join();
        assert(protocolErrors == 3 && gateways == 3 && ok == 6);
        assert(store.size() == 6);
    }

    // an upstream that stops answering fails only its own request
    {
        StubDialer scripted([](const http::HttpRequest&, const std::string&){ return ok_response("quick"); });
        StallingDialer dialer(scripted);
        Config cfg;
        cfg.upstreamReadTimeoutMs = 300;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);

        std::string stalledOut, quickOut;
        long long stalledMs = 0, quickMs = 0;
        std::thread stalled([&]{
            auto start = std::chrono::steady_clock::now();
            stalledOut = ::exchange(icpt, "GET http://stall.test/slow HTTP/1.1\r\nHost: stall.test\r\n\r\n");
            stalledMs = elapsed_ms(start);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::thread quick([&]{
            auto start = std::chrono::steady_clock::now();
            quickOut = ::exchange(icpt, "GET http://quick.test/ HTTP/1.1\r\nHost: quick.test\r\n\r\n");
            quickMs = elapsed_ms(start);
        });
        quick.join();
        stalled.join();

        auto q = split_responses(quickOut);
        assert(q.size() == 1 && q[0].first.status_line.code == 200 && q[0].second == "quick");
        assert(quickMs < cfg.upstreamReadTimeoutMs);
        auto st = split_responses(stalledOut);
        assert(st.size() == 1 && st[0].first.status_line.code == 502);
        assert(stalledMs >= cfg.upstreamReadTimeoutMs);
        assert(store.size() == 1 && store.list_flows()[0].url == "http://quick.test/");
    }

    // a client hanging up while upstream is silent cancels the exchange and records nothing
    {
        StubDialer scripted([](const http::HttpRequest&, const std::string&){ return ok_response("unused"); });
        StallingDialer dialer(scripted);
        Config cfg;
        cfg.upstreamReadTimeoutMs = 5000;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);

        flow::RecordedRequest kept;
        kept.host = "kept.test";
        kept.headers = { { "Host", "kept.test" } };
        flow::RecordedResponse keptResp;
        keptResp.body = "stays";
        auto before = store.record(store.identify(kept), kept, keptResp, false);

        auto client = socket_pair();
        net::Socket& proxySide = client.first;
        net::Socket& userSide = client.second;
        bool sent = userSide.send_all("GET http://stall.test/wait HTTP/1.1\r\nHost: stall.test\r\n\r\n");
        assert(sent);
        ConnectionContext ctx;
        ctx.cancelFd = proxySide.native();
        http::MessageReader reader(proxySide);

        std::thread hangUp([&]{
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            userSide.close();
        });
        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            icpt.serve(proxySide, reader, ctx);
        } catch (const util::CancelledError&) {
            cancelled = true;
        }
        hangUp.join();
        assert(cancelled);
        assert(elapsed_ms(start) < cfg.upstreamReadTimeoutMs);

        // nothing recorded for the cancelled request; the earlier flow is untouched
        assert(store.size() == 1);
        auto after = store.get_flow(before.identity.id);
        assert(after.version == before.version && after.response->body == "stays");

        // the upstream connection was closed: its far end sees the request, then EOF
        assert(dialer.silent.size() == 1);
        net::Socket& upstreamPeer = dialer.silent[0];
        bool timeouts = upstreamPeer.set_timeouts(2000, 2000);
        assert(timeouts);
        std::string forwarded;
        char buf[1024];
        while (auto n = upstreamPeer.read_some(buf, sizeof(buf))) forwarded.append(buf, *n);
        assert(forwarded.compare(0, 10, "GET /wait ") == 0);
    }

    // root certificate download
    {
        std::filesystem::remove("interceptor_test_ca.pem");
        std::filesystem::remove("interceptor_test_ca.key");
        tls::CertConfig cc;
        cc.caCertPath = "interceptor_test_ca.pem";
        cc.caKeyPath = "interceptor_test_ca.key";
        auto ca = tls::CertificateAuthority::create(cc);
        StubDialer dialer([](const http::HttpRequest&, const std::string&){ return ok_response("upstream"); });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec, ca);

        auto pem = split_responses(::exchange(icpt, "GET http://ssl/ HTTP/1.1\r\nHost: ssl\r\n\r\n"));
        assert(pem[0].first.status_line.code == 200 && pem[0].second == ca->export_ca_pem());
        auto der = split_responses(::exchange(icpt, "GET http://cert/root.der HTTP/1.1\r\nHost: cert\r\n\r\n"));
        assert(der[0].second == ca->export_ca_der());
        auto any = split_responses(::exchange(icpt, "GET http://example.test/__softmock/ca.pem HTTP/1.1\r\nHost: example.test\r\n\r\n"));
        assert(any[0].second == ca->export_ca_pem());
        assert(http::find_header(any[0].first.headers, "Content-Disposition")->find("softmock_root_ca.pem") != std::string::npos);
        assert(dialer.dials == 0 && store.size() == 0);
        auto normal = split_responses(::exchange(icpt, "GET http://example.test/ HTTP/1.1\r\nHost: example.test\r\n\r\n"));
        assert(normal[0].second == "upstream");

        std::filesystem::remove(cc.caCertPath);
        std::filesystem::remove(cc.caKeyPath);
    }

    // replay resends the stored request and keeps the override
    {
        Seen seen;
        std::atomic<int> n{0};
        StubDialer dialer([&](const http::HttpRequest& r, const std::string& b){
            seen.add(r, b);
            return ok_response("v" + std::to_string(++n));
        });
        Config cfg;
        flow::FlowStore store;
        InterceptPolicy rec;
        FlowInterceptor icpt(cfg, store, dialer, rec);
        ::exchange(icpt, "POST http://api.test/items?x=1 HTTP/1.1\r\nHost: api.test\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n");
        auto id = store.list_flows()[0].id;
        assert(store.get_flow(id).request.body == "abc");
        flow::OverrideEngine engine(store);
        flow::ResponseOverride o; o.body = "mocked";
        engine.set_override(id, o);

        auto replayed = icpt.replay(id);
        assert(replayed.response->body == "v2");
        assert(replayed.has_active_override());
        assert(seen.targets.back() == "/items?x=1");
        assert(seen.bodies.back() == "abc");
        assert(http::find_header(seen.headers.back(), "Content-Length") == "3");
        assert(!http::find_header(seen.headers.back(), "Transfer-Encoding"));
        assert(http::find_header(seen.headers.back(), "Connection") == "close");

        bool threw = false;
        try { icpt.replay("missing"); } catch (const util::UnknownFlowError&) { threw = true; }
        assert(threw);
        dialer.refuse = true;
        threw = false;
        try { icpt.replay(id); } catch (const util::UpstreamError&) { threw = true; }
        assert(threw);
        assert(store.get_flow(id).response->body == "v2");
    }

    assert(FlowInterceptor::bad_gateway("boom").rfind("HTTP/1.1 502 Bad Gateway\r\n", 0) == 0);
    return 0;
}
