#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/util/Error.h"
#include <cassert>
#include <string>

using namespace softmock::core;
using namespace softmock::core::flow;

namespace {
RecordedResponse live() {
    RecordedResponse r;
    r.status = 200; r.reason = "OK";
    r.headers = { { "Content-Type", "application/json" }, { "Content-Encoding", "gzip" }, { "Content-Length", "3" } };
    r.body = "abc";
    return r;
}
}

int main() {
    // merge keeps unset fields from the prior edit
    ResponseOverride prior; prior.status = 404; prior.body = "gone";
    ResponseOverride edit; edit.body = "still gone";
    auto merged = merge_override(prior, edit);
    assert(merged.status == 404 && *merged.body == "still gone" && !merged.headers);
    assert(ResponseOverride{}.empty() && !merged.empty());

    // body override over a live gzip response
    Flow f;
    f.response = live();
    ResponseOverride bodyOnly; bodyOnly.body = "{\"origin\":\"1.2.3.4\"}";
    f.responseOverride = bodyOnly; f.overrideEnabled = true;
    auto r = materialize_response(f);
    assert(r.status == 200 && r.reason == "OK");
    assert(r.body == *bodyOnly.body);
    assert(http::find_header(r.headers, "Content-Length") == std::to_string(bodyOnly.body->size()));
    assert(!http::find_header(r.headers, "Content-Encoding"));
    assert(http::find_header(r.headers, "Content-Type") == "application/json");

    // status change picks a matching reason unless one is given
    ResponseOverride st; st.status = 503;
    f.responseOverride = st;
    r = materialize_response(f);
    assert(r.status == 503 && r.reason == "Service Unavailable" && r.body == "abc");
    assert(http::find_header(r.headers, "Content-Encoding") == "gzip"); // live body untouched
    st.reason = "Down For Tests";
    f.responseOverride = st;
    assert(materialize_response(f).reason == "Down For Tests");

    // explicit headers replace the live set; framing is recomputed anyway
    ResponseOverride hdr; hdr.headers = http::HeaderList{ { "X-Mock", "1" }, { "Transfer-Encoding", "chunked" }, { "Content-Length", "999" } };
    hdr.body = "12345";
    f.responseOverride = hdr;
    r = materialize_response(f);
    assert(r.headers.size() == 2);
    assert(http::find_header(r.headers, "X-Mock") == "1");
    assert(http::find_header(r.headers, "Content-Length") == "5");
    assert(!http::find_header(r.headers, "Transfer-Encoding"));

    // bodiless statuses drop body and Content-Length
    ResponseOverride nc; nc.status = 204; nc.body = "ignored";
    f.responseOverride = nc;
    r = materialize_response(f);
    assert(r.body.empty() && !http::find_header(r.headers, "Content-Length") && r.reason == "No Content");

    // operator-authored flow without a live response
    Flow authored;
    ResponseOverride made; made.status = 201; made.body = "{}";
    authored.responseOverride = made; authored.overrideEnabled = true;
    r = materialize_response(authored);
    assert(r.status == 201 && r.reason == "Created" && r.body == "{}");

    auto wire = serialize_response(r);
    assert(wire == "HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\n{}");
    assert(serialize_response(r, false) == "HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\n");

    // engine against a store
    FlowStore store;
    RecordedRequest req; req.host = "httpbin.org"; req.target = "/ip";
    auto id = store.identify(req);
    store.record(id, req, live(), false);
    OverrideEngine engine(store);

    bool threw = false;
    ResponseOverride bad; bad.status = 99;
    try { engine.set_override(id.id, bad); } catch (const util::InvalidOverrideError&) { threw = true; }
    assert(threw);
    bad.status = 150; threw = false;
    try { engine.set_override(id.id, bad); } catch (const util::InvalidOverrideError&) { threw = true; }
    assert(threw);
    bad.status = 600; threw = false;
    try { engine.set_override(id.id, bad); } catch (const util::InvalidOverrideError&) { threw = true; }
    assert(threw);
    assert(!store.get_flow(id.id).responseOverride); // rejected edits leave no trace

    threw = false;
    try { engine.set_override("missing", bodyOnly); } catch (const util::UnknownFlowError&) { threw = true; }
    assert(threw);

    ResponseOverride s1; s1.status = 418;
    engine.set_override(id.id, s1);
    ResponseOverride s2; s2.body = "teapot";
    auto after = engine.set_override(id.id, s2);
    assert(after.has_active_override());
    assert(*after.responseOverride->status == 418 && *after.responseOverride->body == "teapot");
    auto served = store.resolve_override(id);
    assert(served && served->status == 418 && served->body == "teapot");

    // disable keeps the edit but stops serving it
    auto off = engine.set_override_enabled(id.id, false);
    assert(off.responseOverride && !off.overrideEnabled);
    assert(!store.resolve_override(id));
    assert(engine.set_override_enabled(id.id, true).has_active_override());

    // clearing reverts to pass-through, and enabling nothing stays disabled
    auto cleared = engine.clear_override(id.id);
    assert(!cleared.responseOverride && !cleared.overrideEnabled);
    assert(!store.resolve_override(id));
    assert(!engine.set_override_enabled(id.id, true).overrideEnabled);
    assert(store.get_flow(id.id).response->body == "abc");
    return 0;
}
