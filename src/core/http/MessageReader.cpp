#include "trafficlens/core/http/MessageReader.h"
#include "trafficlens/core/http/ChunkedDecoder.h"
#include "trafficlens/core/http/Headers.h"
#include <algorithm>

namespace trafficlens::core::http {
BodyFraming request_framing(const HttpRequest& req) {
    BodyFraming f;
    if (header_has_token(req.headers, "Transfer-Encoding", "chunked")) {
        f.kind = BodyFraming::Kind::chunked;
    } else if (auto len = content_length(req.headers); len && *len > 0) {
        f.kind = BodyFraming::Kind::length;
        f.length = *len;
    }
    return f;
}

BodyFraming response_framing(std::string_view request_method, const HttpResponse& resp) {
    BodyFraming f;
    int code = resp.status_line.code;
    if (iequals(request_method, "HEAD") || (code >= 100 && code < 200) || code == 204 || code == 304) return f;
    if (header_has_token(resp.headers, "Transfer-Encoding", "chunked")) {
        f.kind = BodyFraming::Kind::chunked;
    } else if (auto len = content_length(resp.headers)) {
        f.kind = *len > 0 ? BodyFraming::Kind::length : BodyFraming::Kind::none;
        f.length = *len;
    } else {
        f.kind = BodyFraming::Kind::until_close;
    }
    return f;
}

MessageReader::MessageReader(net::Stream& s, std::size_t max_head_bytes) : stream(s), maxHead(max_head_bytes) {
    chunk.resize(16384);
}

bool MessageReader::fill() {
    auto r = stream.recv_some(chunk);
    if (!r || *r <= 0) return false;
    pending.append(chunk.data(), static_cast<size_t>(*r));
    return true;
}

MessageReader::Status MessageReader::read_head(std::string& head) {
    // tolerate stray CRLFs between keep-alive messages
    for (;;) {
        while (!pending.empty() && (pending.front() == '\r' || pending.front() == '\n')) pending.erase(0, 1);
        auto end = pending.find("\r\n\r\n");
        size_t term = 4;
        if (end == std::string::npos) { end = pending.find("\n\n"); term = 2; }
        if (end != std::string::npos) {
            head = pending.substr(0, end + term);
            pending.erase(0, end + term);
            return Status::ok;
        }
        if (pending.size() > maxHead) return Status::too_large;
        bool had_data = !pending.empty();
        if (!fill()) return had_data ? Status::malformed : Status::closed;
    }
}

MessageReader::Status MessageReader::read_request(HttpRequest& out) {
    std::string head;
    auto st = read_head(head);
    if (st != Status::ok) return st;
    auto req = parser.parse_request(head);
    if (!req) return Status::malformed;
    out = std::move(*req);
    return Status::ok;
}

MessageReader::Status MessageReader::read_response(HttpResponse& out) {
    std::string head;
    auto st = read_head(head);
    if (st != Status::ok) return st;
    auto resp = parser.parse_response(head);
    if (!resp) return Status::malformed;
    out = std::move(*resp);
    return Status::ok;
}

bool MessageReader::read_body(const BodyFraming& framing, const BodySink& sink) {
    switch (framing.kind) {
        case BodyFraming::Kind::none:
            return true;
        case BodyFraming::Kind::length: {
            uint64_t remaining = framing.length;
            while (remaining > 0) {
                if (pending.empty() && !fill()) return false;
                auto take = static_cast<size_t>(std::min<uint64_t>(remaining, pending.size()));
                if (!sink(std::string_view(pending.data(), take))) return false;
                pending.erase(0, take);
                remaining -= take;
            }
            return true;
        }
        case BodyFraming::Kind::chunked: {
            ChunkedDecoder dec;
            for (;;) {
                if (pending.empty() && !fill()) return false;
                auto used = dec.feed(pending.data(), pending.size());
                pending.erase(0, used);
                auto piece = dec.take_decoded();
                if (!piece.empty() && !sink(piece)) return false;
                if (dec.error()) return false;
                if (dec.finished()) return true;
            }
        }
        case BodyFraming::Kind::until_close: {
            if (!pending.empty()) {
                if (!sink(pending)) return false;
                pending.clear();
            }
            while (fill()) {
                if (!sink(pending)) return false;
                pending.clear();
            }
            return true;
        }
    }
    return false;
}

bool MessageReader::read_body_capped(const BodyFraming& framing, std::size_t cap, std::string& out, uint64_t* total) {
    uint64_t seen = 0;
    bool ok = read_body(framing, [&](std::string_view piece) {
        seen += piece.size();
        if (out.size() < cap) out.append(piece.data(), std::min(piece.size(), cap - out.size()));
        return true;
    });
    if (total) *total = seen;
    return ok;
}
}
