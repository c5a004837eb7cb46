#include "trafficlens/core/proxy/CaptureFileStore.h"
#include <chrono>
#include <stdexcept>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace trafficlens::core::proxy {
static const char* B64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string CaptureFileStore::b64(std::string_view in) {
    std::string out; out.reserve((in.size() * 4) / 3 + 4);
    unsigned val = 0; int valb = -6;
    for (unsigned char c : in) {
        val = (val << 8) + c; valb += 8;
        while (valb >= 0) { out.push_back(B64[(val >> valb) & 0x3F]); valb -= 6; }
    }
    if (valb > -6) out.push_back(B64[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

std::string CaptureFileStore::escape_json(std::string_view in) {
    std::string o; o.reserve(in.size() + 8);
    for (char c : in) {
        switch (c) {
            case '"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) o += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                else o += c;
        }
    }
    return o;
}

namespace {
std::string headers_json(const http::HeaderList& headers) {
    std::string out = "[";
    for (std::size_t i = 0; i < headers.size(); ++i) {
        if (i) out += ',';
        out += fmt::format("[\"{}\",\"{}\"]", CaptureFileStore::escape_json(headers[i].name), CaptureFileStore::escape_json(headers[i].value));
    }
    out += ']';
    return out;
}
}

std::string CaptureFileStore::to_json(const CapturedRequest& c) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(c.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(c.timestamp - secs).count();
    std::string out = fmt::format("{{\"id\":{},\"timestamp\":\"{:%Y-%m-%dT%H:%M:%S}.{:03d}Z\"", c.id,
                                  fmt::gmtime(std::chrono::system_clock::to_time_t(c.timestamp)), static_cast<int>(millis));
    out += fmt::format(",\"method\":\"{}\",\"url\":\"{}\",\"host\":\"{}\",\"path\":\"{}\"",
                       escape_json(c.method), escape_json(c.url), escape_json(c.host), escape_json(c.path));
    out += ",\"request_headers\":" + headers_json(c.requestHeaders);
    if (!c.requestBody.empty()) out += ",\"request_body_b64\":\"" + b64(c.requestBody) + "\"";
    out += fmt::format(",\"request_size\":{},\"status\":{}", c.requestSize, c.statusCode);
    if (!c.statusText.empty()) out += ",\"status_text\":\"" + escape_json(c.statusText) + "\"";
    out += ",\"response_headers\":" + headers_json(c.responseHeaders);
    if (!c.responseBody.empty()) out += ",\"response_body_b64\":\"" + b64(c.responseBody) + "\"";
    out += fmt::format(",\"response_size\":{},\"duration_ms\":{},\"https\":{}", c.responseSize, c.duration.count(), c.isHttps ? "true" : "false");
    if (!c.tlsVersion.empty()) out += ",\"tls_version\":\"" + escape_json(c.tlsVersion) + "\"";
    if (!c.tlsCipher.empty()) out += ",\"tls_cipher\":\"" + escape_json(c.tlsCipher) + "\"";
    if (!c.sourceIp.empty()) out += fmt::format(",\"source\":\"{}\",\"source_port\":{}", escape_json(c.sourceIp), c.sourcePort);
    if (!c.error.empty()) out += ",\"error\":\"" + escape_json(c.error) + "\"";
    out += '}';
    return out;
}

CaptureFileStore::CaptureFileStore(const std::string& path) : ofs(path, std::ios::app | std::ios::out) {}

void CaptureFileStore::on_capture(const CapturePtr& capture) {
    if (!capture || !ofs.is_open()) return;
    auto line = to_json(*capture);
    std::lock_guard lock(mu);
    ofs << line << '\n';
    ofs.flush();
}

std::shared_ptr<CaptureFileStore> make_file_store(CaptureStore& store, const std::string& path, ListenerHandle* handle) {
    auto ptr = std::make_shared<CaptureFileStore>(path);
    if (!ptr->is_open()) throw std::runtime_error("cannot open capture file " + path);
    auto h = store.add_listener(ptr);
    if (handle) *handle = h;
    return ptr;
}
}
