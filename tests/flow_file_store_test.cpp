#include "softmock/core/flow/FlowFileStore.h"
#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/flow/OverrideEngine.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <chrono>
#include <memory>

using namespace softmock::core::flow;

namespace {
RecordedRequest get(const std::string& host, const std::string& target) {
    RecordedRequest r; r.host = host; r.target = target;
    r.headers = { { "Host", host }, { "Accept", "*/*" } };
    return r;
}
RecordedResponse resp(const std::string& body) {
    RecordedResponse r;
    r.headers = { { "Content-Type", "text/plain" }, { "Content-Length", std::to_string(body.size()) } };
    r.body = body;
    return r;
}

// Holds back the publish of a record whose live body is "slow", so a later
// change reaches the journal first.
struct StallSlowBodies : FlowObserver {
    void on_flow(FlowEvent event, const Flow& flow) override {
        if (event == FlowEvent::recorded && flow.response && flow.response->body == "slow")
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
};

// Runs `first` (which publishes a "slow" snapshot) and, 50 ms later, `second`.
template <typename A, typename B>
void race(A first, B second) {
    std::thread ta(first);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread tb(second);
    ta.join();
    tb.join();
}
}

int main() {
    const std::string path = "flow_file_store_test.ndjson";
    std::filesystem::remove(path);

    std::string keptId, droppedId;
    {
        FlowStore store;
        auto journal = make_flow_file_store(store.dispatcher(), path);
        assert(journal->is_open());
        OverrideEngine engine(store);

        auto r1 = get("httpbin.org", "/ip");
        auto id1 = store.identify(r1);
        store.record(id1, r1, resp(std::string("bin\0ary\n", 8)), true);
        ResponseOverride o; o.status = 202; o.body = "edited \"quoted\"";
        engine.set_override(id1.id, o);
        keptId = id1.id;

        auto r2 = get("gone.test", "/x");
        auto id2 = store.identify(r2);
        store.record(id2, r2, resp("bye"), false);
        droppedId = id2.id;
        store.forget(id2.id);

        // override hits are not journaled
        store.resolve_override(id1);
    }

    // put, put, put, del
    {
        std::ifstream in(path);
        std::string line; int lines = 0; bool sawDel = false;
        while (std::getline(in, line)) {
            ++lines;
            if (line.find("\"op\":\"del\"") != std::string::npos) sawDel = line.find(droppedId) != std::string::npos;
        }
        assert(lines == 4);
        assert(sawDel);
    }

    // a torn trailing write and a garbage line are skipped
    {
        std::ofstream out(path, std::ios::app);
        out << "not json at all\n";
        out << "{\"op\":\"put\",\"id\":\"trunc";
    }

    FlowStore restored;
    assert(load_flows(path, restored) == 1);
    assert(!restored.find(droppedId));
    auto f = restored.get_flow(keptId);
    assert(f.request.host == "httpbin.org" && f.request.target == "/ip" && f.request.port == 80);
    assert(f.tlsIntercepted);
    assert(f.response && f.response->body == std::string("bin\0ary\n", 8));
    assert(f.has_active_override());
    assert(*f.responseOverride->status == 202 && *f.responseOverride->body == "edited \"quoted\"");
    assert(!f.responseOverride->headers);
    assert(f.hits == 1);

    // the restored flow still serves its override and new flows sort after it
    auto served = restored.resolve_override(f.identity);
    assert(served && served->status == 202);
    auto r3 = get("later.test", "/");
    restored.record(restored.identify(r3), r3, resp("n"), false);
    auto list = restored.list_flows();
    assert(list.size() == 2 && list[0].id == keptId && list[1].sequence > list[0].sequence);

    // line codec alone
    assert(!flow_from_json_line("{\"op\":\"del\",\"id\":\"x\"}"));
    auto line = flow_to_json_line(f);
    auto back = flow_from_json_line(line);
    assert(back && back->identity.canonical == f.identity.canonical);

    assert(load_flows("does_not_exist.ndjson", restored) == 0);
    std::filesystem::remove(path);

    // journal lines written out of commit order still restore the committed state
    const std::string racePath = "flow_file_store_race_test.ndjson";
    std::filesystem::remove(racePath);
    auto a = get("a.test", "/"), b = get("b.test", "/"), c = get("c.test", "/");
    std::string aId, bId, cId;
    {
        FlowStore store;
        auto stall = std::make_shared<StallSlowBodies>();
        store.dispatcher().add(stall);
        auto journal = make_flow_file_store(store.dispatcher(), racePath);
        OverrideEngine engine(store);
        auto ia = store.identify(a), ib = store.identify(b), ic = store.identify(c);
        aId = ia.id; bId = ib.id; cId = ic.id;

        // two records of one identity: the later one wins
        race([&] { store.record(ia, a, resp("slow"), false); },
             [&] { store.record(ia, a, resp("v2"), false); });
        assert(store.get_flow(aId).response->body == "v2");

        // a record racing forget stays forgotten
        race([&] { store.record(ib, b, resp("slow"), false); },
             [&] { store.forget(ib.id); });
        assert(!store.find(bId));

        // an override set after a record survives the record's late line
        store.record(ic, c, resp("first"), false);
        race([&] { store.record(ic, c, resp("slow"), false); },
             [&] { ResponseOverride o; o.status = 503; engine.set_override(ic.id, o); });
        assert(store.get_flow(cId).has_active_override());
    }
    {
        FlowStore again;
        assert(load_flows(racePath, again) == 2);
        assert(again.get_flow(aId).response->body == "v2");
        assert(!again.find(bId));
        auto fc = again.get_flow(cId);
        assert(fc.has_active_override() && *fc.responseOverride->status == 503);
        assert(fc.response->body == "slow");

        // a flow recorded again after its deletion outranks the old tombstone
        auto journal = make_flow_file_store(again.dispatcher(), racePath);
        again.record(again.identify(b), b, resp("back"), false);
    }
    {
        FlowStore third;
        assert(load_flows(racePath, third) == 3);
        assert(third.get_flow(bId).response->body == "back");
    }
    std::filesystem::remove(racePath);
    return 0;
}
