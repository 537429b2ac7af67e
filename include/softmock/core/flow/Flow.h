#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "softmock/core/http/HttpParser.h"

namespace softmock::core::flow {
struct RecordedRequest {
    std::string method{"GET"};
    std::string scheme{"http"};
    std::string host;
    uint16_t port{80};
    std::string target{"/"}; // origin-form path plus query
    std::string version{"HTTP/1.1"};
    http::HeaderList headers;
    std::string body; // decoded
};

struct RecordedResponse {
    std::string version{"HTTP/1.1"};
    int status{200};
    std::string reason{"OK"};
    http::HeaderList headers;
    std::string body; // decoded
};

// Operator edit; unset fields fall back to the live response.
struct ResponseOverride {
    std::optional<int> status;
    std::optional<std::string> reason;
    std::optional<http::HeaderList> headers;
    std::optional<std::string> body;
    bool empty() const { return !status && !reason && !headers && !body; }
};

struct FlowIdentity {
    std::string canonical; // METHOD scheme://authority/path?query [#body=...]
    std::string id;        // sha256 hex of canonical
};

struct Flow {
    FlowIdentity identity;
    RecordedRequest request;
    std::optional<RecordedResponse> response;
    std::optional<ResponseOverride> responseOverride;
    bool overrideEnabled{false};
    bool tlsIntercepted{false};
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastSeenAt;
    uint64_t sequence{0};
    uint64_t hits{0};
    uint64_t version{0}; // store-wide commit counter, bumped by every mutation

    bool has_active_override() const { return overrideEnabled && responseOverride.has_value(); }
};

struct FlowSummary {
    std::string id;
    std::string method;
    std::string url;
    std::optional<int> status; // live status, if any
    bool overridden{false};
    uint64_t hits{0};
    uint64_t sequence{0};
};

// scheme://authority/target of a recorded request.
std::string request_url(const RecordedRequest& req);
FlowSummary summarize(const Flow& flow);
}
