#include "softmock/core/http/MessageReader.h"
#include "softmock/core/http/ChunkedDecoder.h"
#include "softmock/core/util/Error.h"
#include <algorithm>
#include <cctype>
#include <optional>

namespace softmock::core::http {
using util::ProtocolError;

namespace {
uint64_t parse_length(const std::string& v) {
    if (v.empty() || v.size() > 18) throw ProtocolError("invalid Content-Length '" + v + "'");
    uint64_t n = 0;
    for (char c : v) {
        if (!std::isdigit((unsigned char)c)) throw ProtocolError("invalid Content-Length '" + v + "'");
        n = n * 10 + uint64_t(c - '0');
    }
    return n;
}

std::string trim(const std::string& v) {
    size_t b = v.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    return v.substr(b, v.find_last_not_of(" \t") - b + 1);
}

BodySpec spec_from_headers(const HeaderList& headers, BodyFraming fallback) {
    if (has_token(headers, "transfer-encoding", "chunked")) return BodySpec{ BodyFraming::chunked, 0 };
    // repeated or list-valued Content-Length must agree (RFC 9112 6.3)
    std::optional<uint64_t> length;
    for (const auto& h : headers) {
        if (!iequals(h.name, "content-length")) continue;
        size_t pos = 0;
        for (;;) {
            size_t comma = h.value.find(',', pos);
            auto n = parse_length(trim(h.value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos)));
            if (length && *length != n) throw ProtocolError("conflicting Content-Length values");
            length = n;
            if (comma == std::string::npos) break;
            pos = comma + 1;
        }
    }
    if (!length) return BodySpec{ fallback, 0 };
    if (*length == 0) return BodySpec{};
    return BodySpec{ BodyFraming::content_length, *length };
}
}

BodySpec request_body_spec(const HttpRequest& req) {
    return spec_from_headers(req.headers, BodyFraming::none);
}

BodySpec response_body_spec(const HttpResponse& resp, std::string_view request_method) {
    int code = resp.status_line.code;
    if (request_method == "HEAD" || (code >= 100 && code < 200) || code == 204 || code == 304) return BodySpec{};
    return spec_from_headers(resp.headers, BodyFraming::until_close);
}

MessageReader::MessageReader(net::Stream& stream, std::size_t max_head_bytes)
    : stream_(stream), max_head_(max_head_bytes) {}

bool MessageReader::fill() {
    if (wait_) wait_();
    char chunk[16384];
    auto r = stream_.read_some(chunk, sizeof(chunk));
    if (!r) return false;
    buffer_.append(chunk, *r);
    return true;
}

std::optional<std::string> MessageReader::read_head() {
    size_t searched = 0;
    for (;;) {
        // tolerate stray CRLFs between pipelined messages
        size_t lead = 0;
        while (lead + 1 < buffer_.size() && buffer_[lead] == '\r' && buffer_[lead + 1] == '\n') lead += 2;
        if (lead) { buffer_.erase(0, lead); searched = 0; }
        auto end = buffer_.find("\r\n\r\n", searched);
        if (end != std::string::npos) {
            if (end + 4 > max_head_) throw ProtocolError("message head exceeds " + std::to_string(max_head_) + " bytes");
            std::string head = buffer_.substr(0, end + 4);
            buffer_.erase(0, end + 4);
            return head;
        }
        if (buffer_.size() > max_head_) throw ProtocolError("message head exceeds " + std::to_string(max_head_) + " bytes");
        searched = buffer_.size() >= 3 ? buffer_.size() - 3 : 0;
        bool hadBytes = !buffer_.empty();
        if (!fill()) {
            if (!hadBytes) return std::nullopt;
            throw ProtocolError("connection closed inside message head");
        }
    }
}

BodyResult MessageReader::read_body(const BodySpec& spec, std::size_t cap, const Overflow& overflow) {
    BodyResult out;
    auto deliver = [&](std::string_view raw, std::string_view decoded) {
        out.wireBytes += raw.size();
        if (out.overflowed) { overflow(raw); return; }
        if (out.decoded.size() + decoded.size() > cap) {
            out.overflowed = true;
            out.raw.append(raw.data(), raw.size());
            std::string retained; retained.swap(out.raw);
            out.decoded.clear();
            overflow(retained);
            return;
        }
        out.raw.append(raw.data(), raw.size());
        out.decoded.append(decoded.data(), decoded.size());
    };

    switch (spec.framing) {
        case BodyFraming::none:
            return out;
        case BodyFraming::content_length: {
            if (spec.length > cap) {
                out.overflowed = true;
                overflow(std::string_view());
            }
            uint64_t remaining = spec.length;
            while (remaining > 0) {
                if (buffer_.empty() && !fill()) throw ProtocolError("connection closed inside message body");
                size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, buffer_.size()));
                std::string_view piece(buffer_.data(), take);
                deliver(piece, piece);
                buffer_.erase(0, take);
                remaining -= take;
            }
            return out;
        }
        case BodyFraming::chunked: {
            ChunkedDecoder dec;
            while (!dec.finished()) {
                if (buffer_.empty() && !fill()) throw ProtocolError("connection closed inside chunked body");
                size_t used = dec.feed(buffer_.data(), buffer_.size());
                if (dec.error()) throw ProtocolError("malformed chunked encoding");
                auto decoded = dec.take_decoded();
                deliver(std::string_view(buffer_.data(), used), decoded);
                buffer_.erase(0, used);
            }
            return out;
        }
        case BodyFraming::until_close: {
            for (;;) {
                if (!buffer_.empty()) {
                    deliver(buffer_, buffer_);
                    buffer_.clear();
                }
                if (!fill()) break;
            }
            return out;
        }
    }
    return out;
}
}
