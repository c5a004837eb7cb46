#include "trafficlens/core/http/HttpParser.h"
#include <charconv>
#include <string_view>

namespace trafficlens::core::http {
namespace {
std::string_view trim(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.remove_suffix(1);
    return v;
}
// Accepts both CRLF and bare LF line endings.
std::string_view next_line(std::string_view head, size_t& pos) {
    auto eol = head.find('\n', pos);
    std::string_view line = eol == std::string_view::npos ? head.substr(pos) : head.substr(pos, eol - pos);
    pos = eol == std::string_view::npos ? head.size() : eol + 1;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}
std::string_view head_of(std::string_view data) {
    auto end = data.find("\r\n\r\n");
    if (end != std::string_view::npos) return data.substr(0, end);
    end = data.find("\n\n");
    if (end != std::string_view::npos) return data.substr(0, end);
    return {};
}
}

std::optional<HttpRequestLine> HttpParser::parse_request_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos || first_space == 0) return std::nullopt;
    auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) return std::nullopt;
    HttpRequestLine rl;
    rl.method = std::string(line.substr(0, first_space));
    rl.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    rl.version = std::string(line.substr(second_space + 1));
    if (rl.target.empty() || rl.version.rfind("HTTP/", 0) != 0) return std::nullopt;
    return rl;
}

std::optional<HttpStatusLine> HttpParser::parse_status_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    HttpStatusLine sl;
    sl.version = std::string(line.substr(0, first_space));
    if (sl.version.rfind("HTTP/", 0) != 0) return std::nullopt;
    auto rest = line.substr(first_space + 1);
    auto second_space = rest.find(' ');
    auto code = rest.substr(0, second_space);
    int value = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), value);
    if (ec != std::errc() || ptr != code.data() + code.size() || code.size() != 3) return std::nullopt;
    sl.code = value;
    if (second_space != std::string_view::npos) sl.reason = std::string(rest.substr(second_space + 1));
    return sl;
}

bool HttpParser::parse_header_block(std::string_view head, size_t pos, HeaderList& out) {
    while (pos < head.size()) {
        auto line = next_line(head, pos);
        if (line.empty()) break;
        if ((line.front() == ' ' || line.front() == '\t') && !out.empty()) {
            // obsolete line folding
            out.back().value += ' ';
            out.back().value += std::string(trim(line));
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return false;
        out.push_back(HttpHeader{ std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))) });
    }
    return true;
}

std::optional<HttpRequest> HttpParser::parse_request(std::string_view data) {
    auto head = head_of(data);
    if (head.empty()) return std::nullopt;
    size_t pos = 0;
    auto rl_opt = parse_request_line(next_line(head, pos));
    if (!rl_opt) return std::nullopt;
    HttpRequest req; req.request_line = std::move(*rl_opt);
    if (!parse_header_block(head, pos, req.headers)) return std::nullopt;
    return req;
}

std::optional<HttpResponse> HttpParser::parse_response(std::string_view data) {
    auto head = head_of(data);
    if (head.empty()) return std::nullopt;
    size_t pos = 0;
    auto sl = parse_status_line(next_line(head, pos));
    if (!sl) return std::nullopt;
    HttpResponse resp; resp.status_line = std::move(*sl);
    if (!parse_header_block(head, pos, resp.headers)) return std::nullopt;
    return resp;
}
}
