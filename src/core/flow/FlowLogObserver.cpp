#include "softmock/core/flow/FlowLogObserver.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>

namespace softmock::core::flow {
using softmock::core::util::Logger;

void FlowLogObserver::on_flow(FlowEvent event, const Flow& flow) {
    auto level = event == FlowEvent::served_override ? Logger::Level::debug : Logger::Level::info;
    if (!Logger::instance().enabled(level)) return;
    std::string status = flow.response ? std::to_string(flow.response->status) : "-";
    std::string extra;
    if (flow.response) extra = fmt::format(" req_body {} resp_body {}", flow.request.body.size(), flow.response->body.size());
    Logger::instance().log(level, fmt::format("flow {} {} {} {} status {} hits {}{}{}", to_string(event),
        flow.identity.id.substr(0, 12), flow.request.method, request_url(flow.request), status, flow.hits,
        flow.has_active_override() ? " [override]" : "", extra));
}

std::shared_ptr<FlowLogObserver> make_flow_log_observer(FlowDispatcher& d) {
    auto o = std::make_shared<FlowLogObserver>();
    d.add(o);
    return o;
}
}
