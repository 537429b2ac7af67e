#include "softmock/core/flow/Flow.h"
#include "softmock/core/http/HostUtil.h"

namespace softmock::core::flow {
std::string request_url(const RecordedRequest& req) {
    return req.scheme + "://" + http::format_authority(req.scheme, req.host, req.port) + req.target;
}

FlowSummary summarize(const Flow& flow) {
    FlowSummary s;
    s.id = flow.identity.id;
    s.method = flow.request.method;
    s.url = request_url(flow.request);
    if (flow.response) s.status = flow.response->status;
    s.overridden = flow.has_active_override();
    s.hits = flow.hits;
    s.sequence = flow.sequence;
    return s;
}
}
