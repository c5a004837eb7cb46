#include "trafficlens/core/proxy/ClientSession.h"
#include "trafficlens/core/http/Headers.h"
#include "trafficlens/core/net/UpstreamConnector.h"
#include "trafficlens/core/tls/TlsStream.h"
#include "trafficlens/core/util/Logger.h"
#include <algorithm>
#include <cerrno>
#include <vector>
#include <poll.h>
#include <fmt/format.h>

namespace trafficlens::core::proxy {
using util::log_debug;
using util::log_warn;
using Status = http::MessageReader::Status;

namespace {
constexpr std::string_view kEstablished = "HTTP/1.1 200 Connection Established\r\n\r\n";
constexpr std::string_view kContinue = "HTTP/1.1 100 Continue\r\n\r\n";

bool client_wants_keep_alive(const http::HttpRequest& req) {
    bool close = http::header_has_token(req.headers, "Connection", "close") ||
                 http::header_has_token(req.headers, "Proxy-Connection", "close");
    if (close) return false;
    if (req.request_line.version == "HTTP/1.0") {
        return http::header_has_token(req.headers, "Connection", "keep-alive") ||
               http::header_has_token(req.headers, "Proxy-Connection", "keep-alive");
    }
    return true;
}

std::string chunk_frame(std::string_view piece) {
    std::string out = fmt::format("{:x}\r\n", piece.size());
    out.append(piece.data(), piece.size());
    out += "\r\n";
    return out;
}

void append_capped(std::string& out, std::string_view piece, std::size_t cap) {
    if (out.size() >= cap) return;
    out.append(piece.data(), std::min(piece.size(), cap - out.size()));
}

std::string bracket(const std::string& host) {
    return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}
}

ClientSession::ClientSession(net::Socket socket, net::Endpoint peer, ProxyHandler& h)
    : client(std::move(socket)), clientPeer(std::move(peer)), handler(h) {}

void ClientSession::start() {
    try {
        process();
    } catch (const std::exception& e) {
        log_warn("session {} failed: {}", clientPeer.to_string(), e.what());
    }
    std::lock_guard lock(legMu);
    client.shutdown();
    client.close();
}

void ClientSession::abort() {
    std::lock_guard lock(legMu);
    aborted = true;
    closing.store(true);
    client.shutdown();
    if (upstreamLeg) upstreamLeg->shutdown();
}

void ClientSession::attach_upstream(net::Socket* upstream) {
    std::lock_guard lock(legMu);
    upstreamLeg = upstream;
    if (upstreamLeg && aborted) upstreamLeg->shutdown();
}

void ClientSession::send_simple(net::Stream& stream, int code, const std::string& body, bool close) {
    auto msg = fmt::format("HTTP/1.1 {} {}\r\nContent-Type: text/plain; charset=utf-8\r\nContent-Length: {}\r\n{}\r\n{}",
                           code, http::status_text(code), body.size(), close ? "Connection: close\r\n" : "", body);
    if (!stream.send_all(msg)) log_debug("could not deliver {} response", code);
}

void ClientSession::process() {
    client.set_timeouts(kClientTimeoutMs, kClientTimeoutMs);
    http::MessageReader reader(client);
    serve(reader, client, nullptr);
}

void ClientSession::serve(http::MessageReader& reader, net::Stream& stream, const SecureLeg* leg) {
    for (;;) {
        if (closing.load()) return;
        waiting.store(true);
        bool ready = reader.has_buffered() || stream.wait_readable(kIdleTimeoutMs);
        http::HttpRequest req;
        Status st = ready && !closing.load() ? reader.read_request(req) : Status::closed;
        waiting.store(false);
        switch (st) {
            case Status::ok: break;
            case Status::closed: return;
            case Status::too_large: send_simple(stream, 431, "request head too large"); return;
            case Status::malformed: send_simple(stream, 400, "malformed request"); return;
        }
        if (http::iequals(req.request_line.method, "CONNECT")) {
            if (leg) {
                send_simple(stream, 400, "CONNECT inside an intercepted tunnel is not supported");
                return;
            }
            handle_connect(req, reader);
            return;
        }
        if (!exchange(req, reader, stream, leg)) return;
    }
}

void ClientSession::handle_connect(const http::HttpRequest& req, http::MessageReader& reader) {
    const auto& authority = req.request_line.target;
    auto ep = net::parse_endpoint(authority, 443);
    if (!ep || ep->host.empty() || ep->port == 0) {
        send_simple(client, 400, "invalid CONNECT target");
        return;
    }
    // Bytes sent ahead of our 200 cannot be fed to the TLS handshake.
    if (handler.should_intercept(ep->host) && !reader.has_buffered()) {
        intercept(authority, ep->host, ep->port);
    } else {
        tunnel(ep->host, ep->port, reader.take_buffered());
    }
}

void ClientSession::tunnel(const std::string& host, uint16_t port, std::string buffered) {
    std::string err;
    auto upstream = net::UpstreamConnector::connect(host, port, kTunnelDialTimeoutMs, &err);
    if (!upstream) {
        log_debug("tunnel {}:{} failed: {}", host, port, err);
        send_simple(client, 502, err);
        return;
    }
    struct Detach { ClientSession& s; ~Detach() { s.attach_upstream(nullptr); } } detach{*this};
    attach_upstream(&*upstream);
    if (!client.send_all(kEstablished)) return;
    if (!buffered.empty() && !upstream->send_all(buffered)) return;

    std::vector<char> buf(16384);
    uint64_t up = 0, down = 0;
    pollfd fds[2] = { { client.native(), POLLIN, 0 }, { upstream->native(), POLLIN, 0 } };
    for (;;) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[0].revents != 0) {
            auto n = client.recv_some(buf);
            if (!n || !upstream->send_all(std::string_view(buf.data(), static_cast<size_t>(*n)))) break;
            up += static_cast<uint64_t>(*n);
        }
        if (fds[1].revents != 0) {
            auto n = upstream->recv_some(buf);
            if (!n || !client.send_all(std::string_view(buf.data(), static_cast<size_t>(*n)))) break;
            down += static_cast<uint64_t>(*n);
        }
    }
    log_debug("tunnel {}:{} closed, {} bytes up, {} bytes down", host, port, up, down);
}

void ClientSession::intercept(const std::string& authority, const std::string& host, uint16_t port) {
    if (!client.send_all(kEstablished)) return;
    std::shared_ptr<const tls::LeafCertificate> leaf;
    try {
        leaf = handler.ca()->cert_for_host(host);
    } catch (const tls::TlsError& e) {
        log_warn("no certificate for {}: {}", host, e.what());
        return;
    }
    std::string err;
    auto secure = tls::TlsStream::accept(client, leaf->serverCtx.get(), &err);
    if (!secure) {
        log_debug("{}: {}", authority, err);
        return;
    }
    SecureLeg leg{ authority, host, port, secure.get() };
    http::MessageReader reader(*secure);
    serve(reader, *secure, &leg);
    secure->shutdown();
}

bool ClientSession::exchange(http::HttpRequest& req, http::MessageReader& reader, net::Stream& stream, const SecureLeg* leg) {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t maxBody = handler.config().maxBodySize;
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    };

    CapturedRequest cap;
    cap.timestamp = std::chrono::system_clock::now();
    cap.method = req.request_line.method;
    cap.requestHeaders = req.headers;
    cap.sourceIp = clientPeer.host;
    cap.sourcePort = clientPeer.port;

    const std::string* hostHeader = http::find_header(req.headers, "Host");
    std::optional<http::HostTarget> target;
    if (leg) {
        http::HostTarget t;
        t.scheme = "https";
        t.host = leg->host;
        t.port = leg->port;
        if (hostHeader && !hostHeader->empty()) t.authority = *hostHeader;
        else t.authority = leg->port == 443 ? bracket(leg->host) : leg->authority;
        if (auto abs = http::parse_absolute_url(req.request_line.target)) t.path = abs->path;
        else if (!req.request_line.target.empty() && req.request_line.target.front() == '/') t.path = req.request_line.target;
        target = std::move(t);
        cap.isHttps = true;
        cap.tlsVersion = leg->client->version();
        cap.tlsCipher = leg->client->cipher();
    } else {
        target = http::extract_host_target(req);
        if (target && target->scheme == "https") cap.isHttps = true;
    }
    if (!target) {
        send_simple(stream, 400, "missing or invalid request target");
        return false;
    }
    cap.url = target->url();
    cap.path = target->path_only();
    cap.host = hostHeader && !hostHeader->empty() ? *hostHeader : target->authority;

    bool keepAlive = client_wants_keep_alive(req);
    const bool expectContinue = http::header_has_token(req.headers, "Expect", "100-continue");
    const auto reqFraming = http::request_framing(req);
    const bool reqChunked = reqFraming.kind == http::BodyFraming::Kind::chunked;

    auto fail = [&](const std::string& error) {
        log_debug("{} {} failed: {}", cap.method, cap.url, error);
        send_simple(stream, 502, error);
        cap.error = error;
        cap.duration = elapsed();
        handler.record(std::move(cap));
        return false;
    };

    http::HeaderList outbound = req.headers;
    http::strip_hop_by_hop(outbound);
    http::remove_header(outbound, "Expect");
    http::remove_header(outbound, "Content-Length");
    if (!http::find_header(outbound, "Host")) outbound.insert(outbound.begin(), http::HttpHeader{ "Host", target->authority });
    if (reqFraming.kind == http::BodyFraming::Kind::length) {
        outbound.push_back({ "Content-Length", std::to_string(reqFraming.length) });
    } else if (reqChunked) {
        outbound.push_back({ "Transfer-Encoding", "chunked" });
    } else if (http::content_length(req.headers)) {
        outbound.push_back({ "Content-Length", "0" });
    }
    outbound.push_back({ "Connection", "close" });
    std::string head = fmt::format("{} {} HTTP/1.1\r\n", cap.method, target->path) + http::serialize_headers(outbound) + "\r\n";

    std::string err;
    auto upstream = net::UpstreamConnector::connect(target->host, target->port, kUpstreamTimeoutMs, &err);
    if (!upstream) return fail(err);
    upstream->set_timeouts(kUpstreamTimeoutMs, kUpstreamTimeoutMs);
    struct Detach { ClientSession& s; ~Detach() { s.attach_upstream(nullptr); } } detach{*this};
    attach_upstream(&*upstream);

    std::unique_ptr<tls::TlsStream> upstreamTls;
    net::Stream* origin = &*upstream;
    if (leg || target->scheme == "https") {
        if (!handler.upstream_context()) return fail("no TLS context for upstream");
        upstreamTls = tls::TlsStream::connect(*upstream, handler.upstream_context(), target->host, &err);
        if (!upstreamTls) return fail(err);
        origin = upstreamTls.get();
        if (!leg) {
            // Absolute-form https:// request on the plain listener: only the origin leg is encrypted.
            cap.tlsVersion = upstreamTls->version();
            cap.tlsCipher = upstreamTls->cipher();
        }
    }
    if (!origin->send_all(head)) return fail("write request to upstream failed");

    if (expectContinue && reqFraming.kind != http::BodyFraming::Kind::none && !stream.send_all(kContinue)) return false;
    bool upstreamOk = true;
    uint64_t reqTotal = 0;
    bool bodyOk = reader.read_body(reqFraming, [&](std::string_view piece) {
        reqTotal += piece.size();
        append_capped(cap.requestBody, piece, maxBody);
        if (upstreamOk) upstreamOk = origin->send_all(reqChunked ? std::string_view(chunk_frame(piece)) : piece);
        return true;
    });
    cap.requestSize = reqTotal;
    if (!bodyOk) {
        // The client went away mid-body; nobody is left to answer.
        cap.error = "read request body: connection closed";
        cap.duration = elapsed();
        handler.record(std::move(cap));
        return false;
    }
    if (upstreamOk && reqChunked) upstreamOk = origin->send_all("0\r\n\r\n");
    if (!upstreamOk) return fail("write request body to upstream failed");

    http::MessageReader upstreamReader(*origin);
    http::HttpResponse resp;
    for (;;) {
        auto st = upstreamReader.read_response(resp);
        if (st == Status::closed) return fail("upstream closed the connection before responding");
        if (st != Status::ok) return fail("malformed response from upstream");
        int code = resp.status_line.code;
        if (code >= 100 && code < 200 && code != 101) continue;
        break;
    }
    const int code = resp.status_line.code;
    cap.statusCode = code;
    cap.statusText = resp.status_line.reason.empty() ? http::status_text(code) : resp.status_line.reason;
    cap.responseHeaders = resp.headers;
    const bool excluded = handler.policy().should_exclude_content_type(cap.content_type());
    const auto respFraming = http::response_framing(cap.method, resp);
    const bool respChunked = respFraming.kind == http::BodyFraming::Kind::chunked;
    // HTTP/1.0 clients get the decoded body delimited by close.
    const bool rechunk = respChunked && req.request_line.version != "HTTP/1.0";

    http::HeaderList back = resp.headers;
    http::strip_hop_by_hop(back);
    if (respChunked) http::remove_header(back, "Content-Length");
    if (rechunk) back.push_back({ "Transfer-Encoding", "chunked" });
    if (respFraming.kind == http::BodyFraming::Kind::until_close || (respChunked && !rechunk) || code == 101) keepAlive = false;
    if (!keepAlive) back.push_back({ "Connection", "close" });
    else if (req.request_line.version == "HTTP/1.0") back.push_back({ "Connection", "keep-alive" });

    bool clientOk = stream.send_all(fmt::format("HTTP/1.1 {} {}\r\n", code, cap.statusText) + http::serialize_headers(back) + "\r\n");
    uint64_t respTotal = 0;
    bool respOk = upstreamReader.read_body(respFraming, [&](std::string_view piece) {
        respTotal += piece.size();
        if (!excluded) append_capped(cap.responseBody, piece, maxBody);
        if (clientOk) clientOk = stream.send_all(rechunk ? std::string_view(chunk_frame(piece)) : piece);
        return clientOk;
    });
    if (clientOk && respOk && rechunk) clientOk = stream.send_all("0\r\n\r\n");
    if (!respOk && clientOk) log_debug("response body from {} ended early", cap.url);

    cap.responseSize = respTotal;
    cap.duration = elapsed();
    handler.record(std::move(cap));
    return keepAlive && clientOk && respOk && !closing.load();
}
}
