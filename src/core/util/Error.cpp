#include "softmock/core/util/Error.h"

namespace softmock::core::util {
const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::protocol: return "ProtocolError";
        case ErrorKind::tls: return "TLSError";
        case ErrorKind::ca: return "CAError";
        case ErrorKind::body_too_large: return "BodyTooLargeError";
        case ErrorKind::upstream: return "UpstreamError";
        case ErrorKind::unknown_flow: return "UnknownFlowError";
        case ErrorKind::invalid_override: return "InvalidOverrideError";
        case ErrorKind::cancelled: return "Cancelled";
    }
    return "?";
}

const char* to_string(TlsFailure failure) {
    switch (failure) {
        case TlsFailure::certificate_rejected: return "certificate-rejected";
        case TlsFailure::unsupported_version: return "unsupported-version";
        case TlsFailure::client_abort: return "client-abort";
        case TlsFailure::hostname_unknown: return "hostname-unknown";
        case TlsFailure::other: return "other";
    }
    return "?";
}
}
