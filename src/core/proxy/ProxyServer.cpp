#include "softmock/core/proxy/ProxyServer.h"
#include "softmock/core/proxy/ClientSession.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <cstdlib>
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <csignal>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#endif

namespace softmock::core::proxy {
using softmock::core::util::log_info;
using softmock::core::util::log_warn;
using softmock::core::util::log_error;
using softmock::core::net::Socket;

namespace {
struct PlatformInit {
    PlatformInit() {
#ifdef _WIN32
        WSADATA d; WSAStartup(MAKEWORD(2,2), &d);
#else
        std::signal(SIGPIPE, SIG_IGN); // writes to vanished peers report errors instead
#endif
    }
    ~PlatformInit() {
#ifdef _WIN32
        WSACleanup();
#endif
    }
};

std::string peer_name(const Socket& s) {
#ifdef _WIN32
    (void)s; return "client";
#else
    sockaddr_storage ss{}; socklen_t len = sizeof(ss);
    if (getpeername(s.native(), reinterpret_cast<sockaddr*>(&ss), &len) != 0) return "client";
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        auto* a = reinterpret_cast<sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
        return fmt::format("{}:{}", buf, ntohs(a->sin_port));
    }
    auto* a6 = reinterpret_cast<sockaddr_in6*>(&ss);
    inet_ntop(AF_INET6, &a6->sin6_addr, buf, sizeof(buf));
    return fmt::format("[{}]:{}", buf, ntohs(a6->sin6_port));
#endif
}
}

ProxyServer::ProxyServer(Config cfg) : config_(std::move(cfg)), store_(config_.identity), overrides_(store_) {
    init();
}

ProxyServer::ProxyServer(Config cfg, std::shared_ptr<UpstreamDialer> dialer)
    : config_(std::move(cfg)), store_(config_.identity), overrides_(store_), dialer_(std::move(dialer)) {
    init();
}

void ProxyServer::init() {
    static PlatformInit platform;
    logObserver_ = flow::make_flow_log_observer(store_.dispatcher());

    // Derive default CA file locations if none provided.
    std::string autoCert, autoKey;
    if (config_.caCertPath.empty() || config_.caKeyPath.empty()) {
#ifdef _WIN32
        const char* appdata = std::getenv("APPDATA");
        std::string base = appdata? std::string(appdata) : std::string(".");
#else
        const char* home = std::getenv("HOME");
        std::string base = home? std::string(home) : std::string(".");
#endif
        base += "/.softmock";
        std::error_code ec; std::filesystem::create_directories(base, ec);
        autoCert = base + "/root_ca.pem";
        autoKey  = base + "/root_ca_key.pem";
    }
    tls::CertConfig cc{};
    cc.caCertPath = config_.caCertPath.empty() ? autoCert : config_.caCertPath;
    cc.caKeyPath  = config_.caKeyPath.empty() ? autoKey : config_.caKeyPath;
    cc.generateIfMissing = config_.generateCaIfMissing;
    cc.leafValidity = config_.leafValidity;
    if (config_.enableTlsMitm) {
        try {
            ca_ = tls::CertificateAuthority::create(cc);
        } catch (const util::CaError& e) {
            log_error(fmt::format("CAError: {}; CONNECT tunnels will not be intercepted", e.what()));
        }
    }

    tls::TlsSettings ts;
    ts.verifyUpstream = config_.verifyUpstream;
    ts.upstreamCaFile = config_.upstreamCaFile;
    terminator_ = std::make_shared<tls::TlsTerminator>(ca_, ts);
    if (!dialer_) dialer_ = std::make_shared<NetworkDialer>(terminator_, config_.upstreamConnectTimeoutMs, config_.upstreamReadTimeoutMs);

    interceptPolicy_.set_enabled(config_.enableTlsMitm);
    interceptPolicy_.set_lists(config_.interceptAllow, config_.interceptDeny);
    recordPolicy_.set_lists(config_.recordAllow, config_.recordDeny);
    interceptor_ = std::make_unique<FlowInterceptor>(config_, store_, *dialer_, recordPolicy_, ca_);

    if (!config_.journalPath.empty()) {
        flow::load_flows(config_.journalPath, store_);
        journal_ = flow::make_flow_file_store(store_.dispatcher(), config_.journalPath);
    }
}

ProxyServer::~ProxyServer() { stop(); }

bool ProxyServer::start() {
    if (active.load()) return true;
    if (!listener.open(config_.listenAddress, config_.listenPort)) {
        log_error(fmt::format("cannot listen on {}:{}", config_.listenAddress, config_.listenPort));
        return false;
    }
    boundPort.store(listener.local_port());
    active.store(true);
    accept_thread = std::thread(&ProxyServer::run_loop, this);
    log_info(fmt::format("proxy listening on {}:{}{}", config_.listenAddress, boundPort.load(),
                         ca_ ? "" : " (TLS interception unavailable)"));
    return true;
}

void ProxyServer::stop() {
    if (!active.exchange(false)) return;
    if (accept_thread.joinable()) accept_thread.join();
    listener.close();
    std::unique_lock lock(sessionsMu);
    for (auto& kv : sessions) kv.second->shutdown();
    sessionsCv.wait(lock, [this]{ return sessions.empty(); });
    log_info("proxy stopped");
}

std::size_t ProxyServer::active_sessions() const {
    std::lock_guard lock(sessionsMu);
    return sessions.size();
}

void ProxyServer::run_loop() {
    while (active.load()) {
        auto client = listener.accept();
        if (!client.valid()) { std::this_thread::sleep_for(std::chrono::milliseconds(4)); continue; }
        auto socket_ptr = std::make_shared<Socket>(std::move(client));
        launch_session(socket_ptr, peer_name(*socket_ptr));
    }
}

void ProxyServer::launch_session(std::shared_ptr<Socket> socket, std::string peer) {
    uint64_t id;
    {
        std::lock_guard lock(sessionsMu);
        id = nextSession++;
        sessions.emplace(id, socket);
    }
    SessionServices svc;
    svc.config = &config_;
    svc.interceptor = interceptor_.get();
    svc.dialer = dialer_.get();
    svc.terminator = terminator_.get();
    svc.interceptPolicy = &interceptPolicy_;
    auto session = std::make_shared<ClientSession>(socket, svc, std::move(peer));
    std::thread([this, id, session]{
        session->run();
        std::lock_guard lock(sessionsMu);
        sessions.erase(id);
        sessionsCv.notify_all();
    }).detach();
}
}
