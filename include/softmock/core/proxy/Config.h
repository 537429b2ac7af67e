#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include "softmock/core/flow/FlowIdentity.h"

namespace softmock::core::proxy {
struct Config {
    std::string listenAddress { "127.0.0.1" };
    uint16_t listenPort { 8080 };                  // 0 picks an ephemeral port

    // TLS MITM settings
    bool enableTlsMitm { true };                   // terminate CONNECT tunnels that pass the intercept policy
    std::string caCertPath;                        // root CA certificate (PEM); empty => ~/.softmock/root_ca.pem
    std::string caKeyPath;                         // root CA private key (PEM)
    bool generateCaIfMissing { true };
    std::chrono::seconds leafValidity { std::chrono::hours(24 * 365) };
    std::vector<std::string> interceptAllow;       // host globs to terminate (empty => all unless denied)
    std::vector<std::string> interceptDeny;        // host globs always tunnelled blind
    uint16_t transparentTlsPort { 443 };           // upstream port for TLS that arrives without CONNECT

    // recording
    std::vector<std::string> recordAllow;          // host globs that participate in recording/override
    std::vector<std::string> recordDeny;
    std::size_t maxBodyBytes { 16 * 1024 * 1024 }; // per message; larger bodies pass through unrecorded
    flow::IdentityOptions identity;
    std::string journalPath;                       // NDJSON journal; empty disables persistence

    // upstream
    bool verifyUpstream { false };
    std::string upstreamCaFile;

    // timeouts (milliseconds)
    int handshakeTimeoutMs { 10000 };
    int clientIdleTimeoutMs { 60000 };
    int upstreamConnectTimeoutMs { 5000 };
    int upstreamReadTimeoutMs { 30000 };
    int tunnelIdleTimeoutMs { 300000 };
};
}
