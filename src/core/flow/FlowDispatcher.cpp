#include "softmock/core/flow/FlowDispatcher.h"

namespace softmock::core::flow {
const char* to_string(FlowEvent event) {
    switch (event) {
        case FlowEvent::recorded: return "recorded";
        case FlowEvent::created: return "created";
        case FlowEvent::edited: return "edited";
        case FlowEvent::served_override: return "served-override";
        case FlowEvent::removed: return "removed";
    }
    return "?";
}

void FlowDispatcher::add(std::shared_ptr<FlowObserver> obs) {
    std::lock_guard lock(guard);
    observers.push_back(obs);
}

void FlowDispatcher::publish(FlowEvent event, const Flow& flow) {
    std::vector<std::shared_ptr<FlowObserver>> alive;
    {
        std::lock_guard lock(guard);
        for (auto it = observers.begin(); it != observers.end();) {
            if (auto s = it->lock()) { alive.push_back(std::move(s)); ++it; }
            else it = observers.erase(it);
        }
    }
    for (auto& o : alive) o->on_flow(event, flow);
}
}
