#pragma once
#include "softmock/core/flow/FlowDispatcher.h"
#include <memory>

namespace softmock::core::flow {
class FlowLogObserver : public FlowObserver, public std::enable_shared_from_this<FlowLogObserver> {
public:
    void on_flow(FlowEvent event, const Flow& flow) override;
};
std::shared_ptr<FlowLogObserver> make_flow_log_observer(FlowDispatcher& d);
}
