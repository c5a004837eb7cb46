#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "trafficlens/core/net/Stream.h"
#include "trafficlens/core/http/HttpParser.h"

namespace trafficlens::core::http {
struct BodyFraming {
    enum class Kind { none, length, chunked, until_close };
    Kind kind{Kind::none};
    uint64_t length{0};
};

BodyFraming request_framing(const HttpRequest& req);
BodyFraming response_framing(std::string_view request_method, const HttpResponse& resp);

// Buffered reader of HTTP/1.1 messages from a stream. Bytes read past the
// end of one message stay buffered for the next (keep-alive).
class MessageReader {
public:
    enum class Status { ok, closed, malformed, too_large };
    using BodySink = std::function<bool(std::string_view)>;

    explicit MessageReader(net::Stream& stream, std::size_t max_head_bytes = 64 * 1024);

    Status read_request(HttpRequest& out);
    Status read_response(HttpResponse& out);
    // Streams the decoded body into `sink`. Returns false on I/O or framing
    // error, or when the sink returns false.
    bool read_body(const BodyFraming& framing, const BodySink& sink);
    // Reads the body keeping at most `cap` bytes; the remainder is drained.
    bool read_body_capped(const BodyFraming& framing, std::size_t cap, std::string& out, uint64_t* total = nullptr);
    bool has_buffered() const { return !pending.empty(); }
    // Hands over bytes read past the last message, e.g. when a CONNECT turns
    // the connection into a raw tunnel.
    std::string take_buffered() { std::string out; out.swap(pending); return out; }

private:
    Status read_head(std::string& head);
    bool fill();
    net::Stream& stream;
    std::size_t maxHead;
    std::string pending;
    std::vector<char> chunk;
    HttpParser parser;
};
}
