#pragma once
#include <map>
#include <vector>
#include <string>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <atomic>
#include "softmock/core/flow/Flow.h"
#include "softmock/core/flow/FlowIdentity.h"
#include "softmock/core/flow/FlowDispatcher.h"

namespace softmock::core::flow {
// Identity -> Flow map shared by every connection. Lookups take a shared lock,
// every mutation an exclusive one; observers run after the lock is dropped,
// so they may see events out of commit order. Flow::version gives that order.
class FlowStore {
public:
    explicit FlowStore(IdentityOptions options = {}) : options_(std::move(options)) {}
    FlowStore(const FlowStore&) = delete;
    FlowStore& operator=(const FlowStore&) = delete;

    const IdentityOptions& identity_options() const { return options_; }
    FlowIdentity identify(const RecordedRequest& req) const { return compute_identity(req, options_); }
    FlowDispatcher& dispatcher() { return dispatcher_; }

    // If the flow has an active override, counts the hit and returns the
    // response to serve. Decided and updated in one critical section.
    std::optional<RecordedResponse> resolve_override(const FlowIdentity& identity);

    // Inserts or refreshes the live exchange for `identity`. The override of an
    // existing flow is left alone.
    Flow record(const FlowIdentity& identity, RecordedRequest request, RecordedResponse response, bool tls_intercepted);

    // Registers a flow authored by the operator. Throws InvalidOverrideError if
    // the identity already exists.
    Flow create_flow(RecordedRequest request, std::optional<RecordedResponse> response = std::nullopt);

    std::vector<FlowSummary> list_flows() const;
    std::optional<Flow> find(const std::string& id) const;
    // Throws UnknownFlowError.
    Flow get_flow(const std::string& id) const;

    // Applies `edit` under the exclusive lock and returns the result. The
    // identity cannot be changed. Throws UnknownFlowError.
    Flow modify(const std::string& id, const std::function<void(Flow&)>& edit);

    // Throws UnknownFlowError.
    void forget(const std::string& id);
    // Removes every flow, or those whose host matches `host_glob`. Returns the count.
    std::size_t clear(const std::string& host_glob = "");

    // Re-inserts a journaled flow verbatim without notifying observers. Later
    // mutations are versioned above the restored one.
    void restore(Flow flow);
    // Makes the next mutation's version exceed `version`.
    void advance_version(uint64_t version);

    std::size_t size() const;
private:
    IdentityOptions options_;
    mutable std::shared_mutex mu_;
    std::map<std::string, Flow> flows_;
    std::atomic<uint64_t> nextSequence_{1};
    uint64_t version_{0}; // guarded by mu_
    FlowDispatcher dispatcher_;
};
}
