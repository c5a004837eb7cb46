#include "trafficlens/core/http/Headers.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace trafficlens::core::http {
namespace {
inline char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

constexpr std::array<std::string_view, 9> kHopByHop = {
    "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
    "Te", "Trailer", "Transfer-Encoding", "Upgrade", "Proxy-Connection",
};

std::string_view trim(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.remove_suffix(1);
    return v;
}
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) if (lower(a[i]) != lower(b[i])) return false;
    return true;
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b){ return lower(a) == lower(b); });
    return it != haystack.end();
}

std::string to_lower(std::string_view v) {
    std::string out(v);
    std::transform(out.begin(), out.end(), out.begin(), lower);
    return out;
}

const std::string* find_header(const HeaderList& headers, std::string_view name) {
    for (auto& h : headers) if (iequals(h.name, name)) return &h.value;
    return nullptr;
}

void remove_header(HeaderList& headers, std::string_view name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
        [&](const HttpHeader& h){ return iequals(h.name, name); }), headers.end());
}

void set_header(HeaderList& headers, std::string_view name, std::string value) {
    remove_header(headers, name);
    headers.push_back(HttpHeader{ std::string(name), std::move(value) });
}

bool header_has_token(const HeaderList& headers, std::string_view name, std::string_view token) {
    for (auto& h : headers) {
        if (!iequals(h.name, name)) continue;
        std::string_view v = h.value;
        while (!v.empty()) {
            auto comma = v.find(',');
            auto item = trim(v.substr(0, comma));
            if (iequals(item, token)) return true;
            if (comma == std::string_view::npos) break;
            v.remove_prefix(comma + 1);
        }
    }
    return false;
}

std::optional<uint64_t> content_length(const HeaderList& headers) {
    auto v = find_header(headers, "Content-Length");
    if (!v) return std::nullopt;
    auto s = trim(*v);
    uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return n;
}

bool is_hop_by_hop(std::string_view name) {
    for (auto h : kHopByHop) if (iequals(h, name)) return true;
    return false;
}

void strip_hop_by_hop(HeaderList& headers) {
    // Connection may name further per-hop headers.
    std::vector<std::string> named;
    for (auto& h : headers) {
        if (!iequals(h.name, "Connection")) continue;
        std::string_view v = h.value;
        while (!v.empty()) {
            auto comma = v.find(',');
            auto item = trim(v.substr(0, comma));
            if (!item.empty()) named.emplace_back(item);
            if (comma == std::string_view::npos) break;
            v.remove_prefix(comma + 1);
        }
    }
    headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const HttpHeader& h) {
        if (is_hop_by_hop(h.name)) return true;
        for (auto& n : named) if (iequals(h.name, n)) return true;
        return false;
    }), headers.end());
}

std::string serialize_headers(const HeaderList& headers) {
    std::string out;
    for (auto& h : headers) {
        out += h.name;
        out += ": ";
        out += h.value;
        out += "\r\n";
    }
    return out;
}

const char* status_text(int code) {
    switch (code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}
}
