#pragma once
#include <string>
#include "softmock/core/flow/Flow.h"
#include "softmock/core/flow/FlowStore.h"

namespace softmock::core::flow {
// Fields set in `edit` replace those in `prior`; unset fields keep prior values.
ResponseOverride merge_override(const ResponseOverride& prior, const ResponseOverride& edit);

// Response to serve for `flow`: the override over the live response (or over
// a bare 200 OK), with Content-Length matching the body and no Transfer-Encoding.
RecordedResponse materialize_response(const Flow& flow);

// Head and body in wire form; the body is left out for HEAD requests.
std::string serialize_response(const RecordedResponse& resp, bool include_body = true);

// Operator-facing edits of stored flows.
class OverrideEngine {
public:
    explicit OverrideEngine(FlowStore& store) : store_(store) {}

    // Merges `partial` into the flow's override and enables it. Throws
    // UnknownFlowError or InvalidOverrideError (status outside 200-599).
    Flow set_override(const std::string& id, const ResponseOverride& partial);
    // Drops the override; the next match goes upstream again. Throws UnknownFlowError.
    Flow clear_override(const std::string& id);
    // Keeps the edit but stops (or resumes) serving it. Throws UnknownFlowError.
    Flow set_override_enabled(const std::string& id, bool enabled);
private:
    FlowStore& store_;
};
}
