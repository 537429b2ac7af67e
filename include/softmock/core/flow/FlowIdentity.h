#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "softmock/core/flow/Flow.h"

namespace softmock::core::flow {
struct IdentityOptions {
    // append the SHA-256 of the decoded body, so requests differing only in body are distinct
    bool includeBodyHash{false};
    // query parameters dropped before comparison (cache busters, timestamps)
    std::vector<std::string> ignoredQueryParams;
};

// Deterministic identity of a request; header values never participate.
FlowIdentity compute_identity(const RecordedRequest& req, const IdentityOptions& options = {});

// Drops ignored parameters and stable-sorts the rest by name.
std::string normalize_query(std::string_view query, const std::vector<std::string>& ignored);
}
