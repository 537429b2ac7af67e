#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include "softmock/core/flow/Flow.h"

namespace softmock::core::flow {
enum class FlowEvent { recorded, created, edited, served_override, removed };
const char* to_string(FlowEvent event);

class FlowObserver {
public:
    virtual ~FlowObserver() = default;
    virtual void on_flow(FlowEvent event, const Flow& flow) = 0;
};

// Fans store changes out to observers. Observers are held weakly and invoked
// outside any store lock, on the thread that made the change.
class FlowDispatcher {
public:
    void add(std::shared_ptr<FlowObserver> obs);
    void publish(FlowEvent event, const Flow& flow);
private:
    std::mutex guard;
    std::vector<std::weak_ptr<FlowObserver>> observers;
};
}
