#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include "softmock/core/util/Glob.h"

namespace softmock::core::proxy {
// Runtime enable toggle plus host allow/deny globs. Used both to decide which
// tunnels get TLS-terminated and which hosts take part in recording.
class InterceptPolicy {
public:
    void set_enabled(bool v){ enabled.store(v, std::memory_order_relaxed); }
    bool is_enabled() const { return enabled.load(std::memory_order_relaxed); }
    void set_lists(std::vector<std::string> allow, std::vector<std::string> deny){ std::lock_guard<std::mutex> lk(mu); allow_list = std::move(allow); deny_list = std::move(deny); }
    bool allows(const std::string& host) const {
        if(!is_enabled()) return false;
        std::lock_guard<std::mutex> lk(mu);
        for(auto &p: deny_list){ if(util::glob_match(p, host)) return false; }
        if(allow_list.empty()) return true;
        for(auto &p: allow_list){ if(util::glob_match(p, host)) return true; }
        return false;
    }
private:
    std::atomic<bool> enabled { true };
    mutable std::mutex mu;
    std::vector<std::string> allow_list;
    std::vector<std::string> deny_list;
};
}
