#pragma once
#include <cstdint>
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <memory>
#include "softmock/core/net/Socket.h"
#include "softmock/core/flow/FlowStore.h"
#include "softmock/core/flow/OverrideEngine.h"
#include "softmock/core/flow/FlowFileStore.h"
#include "softmock/core/flow/FlowLogObserver.h"
#include "softmock/core/proxy/Config.h"
#include "softmock/core/proxy/InterceptPolicy.h"
#include "softmock/core/proxy/UpstreamDialer.h"
#include "softmock/core/proxy/FlowInterceptor.h"
#include "softmock/core/tls/CertificateAuthority.h"
#include "softmock/core/tls/TlsTerminator.h"

namespace softmock::core::proxy {
class ProxyServer {
public:
    explicit ProxyServer(Config cfg = {});
    // Routes every upstream connection through `dialer` (tests).
    ProxyServer(Config cfg, std::shared_ptr<UpstreamDialer> dialer);
    ~ProxyServer();
    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Binds the listener and starts accepting; false when the bind fails.
    bool start();
    // Stops accepting, hangs up on every client and waits for their sessions to end.
    void stop();
    bool running() const { return active.load(); }
    uint16_t bound_port() const { return boundPort.load(); }

    const Config& config() const { return config_; }
    flow::FlowStore& store() { return store_; }
    flow::OverrideEngine& overrides() { return overrides_; }
    FlowInterceptor& interceptor() { return *interceptor_; }
    // null when no usable root could be loaded or generated
    std::shared_ptr<tls::CertificateAuthority> certificate_authority() const { return ca_; }
    InterceptPolicy& intercept_policy() { return interceptPolicy_; }
    InterceptPolicy& record_policy() { return recordPolicy_; }
    std::size_t active_sessions() const;
private:
    void init();
    void run_loop();
    void launch_session(std::shared_ptr<net::Socket> socket, std::string peer);

    Config config_;
    flow::FlowStore store_;
    flow::OverrideEngine overrides_;
    std::shared_ptr<flow::FlowLogObserver> logObserver_;
    std::shared_ptr<flow::FlowFileStore> journal_;
    std::shared_ptr<tls::CertificateAuthority> ca_;
    std::shared_ptr<tls::TlsTerminator> terminator_;
    std::shared_ptr<UpstreamDialer> dialer_;
    std::unique_ptr<FlowInterceptor> interceptor_;
    InterceptPolicy interceptPolicy_;
    InterceptPolicy recordPolicy_;

    net::Listener listener;
    std::thread accept_thread;
    std::atomic<bool> active { false };
    std::atomic<uint16_t> boundPort { 0 };

    mutable std::mutex sessionsMu;
    std::condition_variable sessionsCv;
    std::unordered_map<uint64_t, std::shared_ptr<net::Socket>> sessions;
    uint64_t nextSession { 1 };
};
}
