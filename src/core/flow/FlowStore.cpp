#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Glob.h"
#include <algorithm>
#include <mutex>

namespace softmock::core::flow {
using std::chrono::system_clock;

std::optional<RecordedResponse> FlowStore::resolve_override(const FlowIdentity& identity) {
    Flow snapshot;
    RecordedResponse served;
    {
        std::unique_lock lock(mu_);
        auto it = flows_.find(identity.id);
        if (it == flows_.end() || !it->second.has_active_override()) return std::nullopt;
        Flow& f = it->second;
        f.lastSeenAt = system_clock::now();
        ++f.hits;
        served = materialize_response(f);
        f.version = ++version_;
        snapshot = f;
    }
    dispatcher_.publish(FlowEvent::served_override, snapshot);
    return served;
}

Flow FlowStore::record(const FlowIdentity& identity, RecordedRequest request, RecordedResponse response, bool tls_intercepted) {
    Flow snapshot;
    {
        std::unique_lock lock(mu_);
        auto now = system_clock::now();
        auto [it, inserted] = flows_.try_emplace(identity.id);
        Flow& f = it->second;
        if (inserted) {
            f.identity = identity;
            f.createdAt = now;
            f.sequence = nextSequence_++;
        }
        f.request = std::move(request);
        f.response = std::move(response);
        f.tlsIntercepted = tls_intercepted;
        f.lastSeenAt = now;
        ++f.hits;
        f.version = ++version_;
        snapshot = f;
    }
    dispatcher_.publish(FlowEvent::recorded, snapshot);
    return snapshot;
}

Flow FlowStore::create_flow(RecordedRequest request, std::optional<RecordedResponse> response) {
    auto identity = identify(request);
    Flow snapshot;
    {
        std::unique_lock lock(mu_);
        if (flows_.count(identity.id))
            throw util::InvalidOverrideError("flow already exists: " + identity.canonical);
        Flow f;
        f.identity = identity;
        f.request = std::move(request);
        f.response = std::move(response);
        f.createdAt = f.lastSeenAt = system_clock::now();
        f.sequence = nextSequence_++;
        f.version = ++version_;
        snapshot = flows_.emplace(identity.id, std::move(f)).first->second;
    }
    dispatcher_.publish(FlowEvent::created, snapshot);
    return snapshot;
}

std::vector<FlowSummary> FlowStore::list_flows() const {
    std::vector<FlowSummary> out;
    {
        std::shared_lock lock(mu_);
        out.reserve(flows_.size());
        for (const auto& kv : flows_) out.push_back(summarize(kv.second));
    }
    std::sort(out.begin(), out.end(), [](const FlowSummary& a, const FlowSummary& b){ return a.sequence < b.sequence; });
    return out;
}

std::optional<Flow> FlowStore::find(const std::string& id) const {
    std::shared_lock lock(mu_);
    auto it = flows_.find(id);
    if (it == flows_.end()) return std::nullopt;
    return it->second;
}

Flow FlowStore::get_flow(const std::string& id) const {
    auto f = find(id);
    if (!f) throw util::UnknownFlowError(id);
    return *f;
}

Flow FlowStore::modify(const std::string& id, const std::function<void(Flow&)>& edit) {
    Flow snapshot;
    {
        std::unique_lock lock(mu_);
        auto it = flows_.find(id);
        if (it == flows_.end()) throw util::UnknownFlowError(id);
        Flow working = it->second;
        edit(working);
        working.identity = it->second.identity;
        working.sequence = it->second.sequence;
        working.version = ++version_;
        it->second = std::move(working);
        snapshot = it->second;
    }
    dispatcher_.publish(FlowEvent::edited, snapshot);
    return snapshot;
}

void FlowStore::forget(const std::string& id) {
    Flow removed;
    {
        std::unique_lock lock(mu_);
        auto it = flows_.find(id);
        if (it == flows_.end()) throw util::UnknownFlowError(id);
        removed = std::move(it->second);
        removed.version = ++version_;
        flows_.erase(it);
    }
    dispatcher_.publish(FlowEvent::removed, removed);
}

std::size_t FlowStore::clear(const std::string& host_glob) {
    std::vector<Flow> removed;
    {
        std::unique_lock lock(mu_);
        for (auto it = flows_.begin(); it != flows_.end();) {
            if (host_glob.empty() || util::glob_match(host_glob, it->second.request.host)) {
                removed.push_back(std::move(it->second));
                removed.back().version = ++version_;
                it = flows_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& f : removed) dispatcher_.publish(FlowEvent::removed, f);
    return removed.size();
}

void FlowStore::restore(Flow flow) {
    std::unique_lock lock(mu_);
    if (flow.sequence >= nextSequence_) nextSequence_ = flow.sequence + 1;
    if (flow.sequence == 0) flow.sequence = nextSequence_++;
    if (flow.version > version_) version_ = flow.version;
    flows_[flow.identity.id] = std::move(flow);
}

void FlowStore::advance_version(uint64_t version) {
    std::unique_lock lock(mu_);
    if (version > version_) version_ = version;
}

std::size_t FlowStore::size() const {
    std::shared_lock lock(mu_);
    return flows_.size();
}
}
