#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/util/Error.h"
#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace softmock::core;
using namespace softmock::core::flow;

namespace {
RecordedRequest get(const std::string& host, const std::string& target) {
    RecordedRequest r; r.host = host; r.target = target; return r;
}
RecordedResponse resp(int status, const std::string& body) {
    RecordedResponse r; r.status = status; r.body = body;
    r.headers.push_back({ "Content-Length", std::to_string(body.size()) });
    return r;
}

struct CountingObserver : FlowObserver {
    std::atomic<int> recorded{0}, edited{0}, removed{0}, served{0}, created{0};
    void on_flow(FlowEvent e, const Flow&) override {
        switch (e) {
            case FlowEvent::recorded: ++recorded; break;
            case FlowEvent::edited: ++edited; break;
            case FlowEvent::removed: ++removed; break;
            case FlowEvent::served_override: ++served; break;
            case FlowEvent::created: ++created; break;
        }
    }
};
}

int main() {
    FlowStore store;
    auto obs = std::make_shared<CountingObserver>();
    store.dispatcher().add(obs);

    // record creates, re-record refreshes the live response only
    auto req = get("httpbin.org", "/ip");
    auto id = store.identify(req);
    auto f1 = store.record(id, req, resp(200, "one"), false);
    assert(f1.identity.id == id.id && f1.hits == 1 && f1.sequence > 0);
    assert(store.size() == 1);
    OverrideEngine engine(store);
    ResponseOverride edit; edit.body = "edited";
    engine.set_override(id.id, edit);
    auto f2 = store.record(id, req, resp(200, "two"), true);
    assert(f2.response->body == "two");
    assert(f2.responseOverride && *f2.responseOverride->body == "edited"); // untouched
    assert(f2.tlsIntercepted && f2.hits == 2);
    assert(f2.sequence == f1.sequence && f2.createdAt == f1.createdAt);

    // resolve_override counts hits and materializes
    auto served = store.resolve_override(id);
    assert(served && served->body == "edited");
    assert(store.get_flow(id.id).hits == 3);
    assert(!store.resolve_override(store.identify(get("other.test", "/"))).has_value());

    // listing follows insertion order
    store.record(store.identify(get("b.test", "/")), get("b.test", "/"), resp(404, ""), false);
    auto list = store.list_flows();
    assert(list.size() == 2);
    assert(list[0].id == id.id && list[0].overridden && list[0].status == 200);
    assert(list[1].url == "http://b.test/" && !list[1].overridden);

    // unknown ids
    bool threw = false;
    try { store.get_flow("nope"); } catch (const util::UnknownFlowError& e) { threw = (e.id() == "nope"); }
    assert(threw);
    threw = false;
    try { store.forget("nope"); } catch (const util::UnknownFlowError&) { threw = true; }
    assert(threw);
    assert(!store.find("nope").has_value());

    // modify cannot change identity
    store.modify(id.id, [](Flow& f){ f.identity.id = "hijack"; f.identity.canonical = "x"; f.hits = 42; });
    auto m = store.get_flow(id.id);
    assert(m.identity.id == id.id && m.identity.canonical == id.canonical && m.hits == 42);

    // create_flow registers operator-authored flows and rejects duplicates
    auto authored = store.create_flow(get("mock.test", "/new"), resp(201, "{}"));
    assert(authored.response->status == 201 && authored.hits == 0);
    threw = false;
    try { store.create_flow(get("mock.test", "/new")); } catch (const util::InvalidOverrideError&) { threw = true; }
    assert(threw);

    // clear by host glob, then everything
    assert(store.clear("*.test") == 2);
    assert(store.size() == 1);
    store.forget(id.id);
    assert(store.size() == 0);
    assert(store.clear() == 0);

    assert(obs->recorded == 3 && obs->served == 1 && obs->created == 1 && obs->removed == 3 && obs->edited == 2);

    // concurrent edits and reads: readers never observe a half-applied edit
    {
        FlowStore s;
        auto r = get("race.test", "/");
        auto rid = s.identify(r);
        s.record(rid, r, resp(200, "live"), false);
        OverrideEngine e(s);
        std::atomic<bool> stop{false};
        std::atomic<int> torn{0};
        std::vector<std::thread> readers;
        for (int t = 0; t < 2; ++t) {
            readers.emplace_back([&]{
                while (!stop.load()) {
                    auto f = s.get_flow(rid.id);
                    if (!f.responseOverride) { std::this_thread::yield(); continue; }
                    // writers always set status and body together: status 200+k pairs with body "k"
                    int k = *f.responseOverride->status - 200;
                    if (*f.responseOverride->body != std::to_string(k)) ++torn;
                    std::this_thread::yield();
                }
            });
        }
        std::vector<std::thread> writers;
        for (int t = 0; t < 2; ++t) {
            writers.emplace_back([&, t]{
                for (int i = 0; i < 200; ++i) {
                    int k = (t * 200 + i) % 300;
                    ResponseOverride o; o.status = 200 + k; o.body = std::to_string(k);
                    e.set_override(rid.id, o);
                    s.record(rid, r, resp(200, "live"), false);
                }
            });
        }
        for (auto& w : writers) w.join();
        stop = true;
        for (auto& rd : readers) rd.join();
        assert(torn == 0);
        assert(s.size() == 1);
        assert(s.get_flow(rid.id).response->body == "live");
    }

    // concurrent recording of one identity keeps exactly one flow
    {
        FlowStore s;
        auto r = get("many.test", "/x");
        auto rid = s.identify(r);
        std::vector<std::thread> ts;
        for (int t = 0; t < 8; ++t) ts.emplace_back([&]{ for (int i = 0; i < 50; ++i) s.record(rid, r, resp(200, "x"), false); });
        for (auto& t : ts) t.join();
        assert(s.size() == 1);
        assert(s.get_flow(rid.id).hits == 400);
    }
    return 0;
}
