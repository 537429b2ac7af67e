#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstddef>

namespace softmock::core::util {
enum class ErrorKind { protocol, tls, ca, body_too_large, upstream, unknown_flow, invalid_override, cancelled };

const char* to_string(ErrorKind kind);

// Base of every error raised by the proxy core. Connection-level errors are
// caught at the ClientSession boundary; none of them stop the listener.
class ProxyError : public std::runtime_error {
public:
    ProxyError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

class ProtocolError : public ProxyError {
public:
    explicit ProtocolError(const std::string& message) : ProxyError(ErrorKind::protocol, message) {}
};

enum class TlsFailure { certificate_rejected, unsupported_version, client_abort, hostname_unknown, other };

const char* to_string(TlsFailure failure);

class TlsError : public ProxyError {
public:
    TlsError(TlsFailure failure, std::string host, const std::string& message)
        : ProxyError(ErrorKind::tls, message), failure_(failure), host_(std::move(host)) {}
    TlsFailure failure() const { return failure_; }
    const std::string& host() const { return host_; }
    // true when the client refused our certificate or we could not tell which host to impersonate
    bool hostname_related() const { return failure_ == TlsFailure::certificate_rejected || failure_ == TlsFailure::hostname_unknown; }
private:
    TlsFailure failure_;
    std::string host_;
};

class CaError : public ProxyError {
public:
    explicit CaError(const std::string& message) : ProxyError(ErrorKind::ca, message) {}
};

class BodyTooLargeError : public ProxyError {
public:
    explicit BodyTooLargeError(std::size_t limit)
        : ProxyError(ErrorKind::body_too_large, "body exceeds capture limit of " + std::to_string(limit) + " bytes"), limit_(limit) {}
    std::size_t limit() const { return limit_; }
private:
    std::size_t limit_;
};

class UpstreamError : public ProxyError {
public:
    UpstreamError(std::string host, uint16_t port, const std::string& message)
        : ProxyError(ErrorKind::upstream, message), host_(std::move(host)), port_(port) {}
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
private:
    std::string host_;
    uint16_t port_;
};

class UnknownFlowError : public ProxyError {
public:
    explicit UnknownFlowError(std::string id) : ProxyError(ErrorKind::unknown_flow, "unknown flow " + id), id_(std::move(id)) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

class InvalidOverrideError : public ProxyError {
public:
    explicit InvalidOverrideError(const std::string& message) : ProxyError(ErrorKind::invalid_override, message) {}
};

class CancelledError : public ProxyError {
public:
    explicit CancelledError(const std::string& message) : ProxyError(ErrorKind::cancelled, message) {}
};
}
