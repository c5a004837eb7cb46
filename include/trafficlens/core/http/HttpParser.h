#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace trafficlens::core::http {
struct HttpHeader { std::string name; std::string value; };
using HeaderList = std::vector<HttpHeader>;
struct HttpRequestLine { std::string method; std::string target; std::string version; };
struct HttpRequest { HttpRequestLine request_line; HeaderList headers; };
struct HttpStatusLine { std::string version; int code{0}; std::string reason; };
struct HttpResponse { HttpStatusLine status_line; HeaderList headers; };

// Parses message heads. `data` must contain the terminating blank line.
class HttpParser {
public:
    std::optional<HttpRequestLine> parse_request_line(std::string_view line);
    std::optional<HttpRequest> parse_request(std::string_view data);
    std::optional<HttpStatusLine> parse_status_line(std::string_view line);
    std::optional<HttpResponse> parse_response(std::string_view data);
private:
    static bool parse_header_block(std::string_view head, size_t pos, HeaderList& out);
};
}
