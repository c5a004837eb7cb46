#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <memory>
#include <map>
#include "trafficlens/core/http/HttpParser.h"

namespace trafficlens::core::proxy {
struct CapturedRequest {
    uint64_t id{0};                                   // 0 until the store assigns one
    std::chrono::system_clock::time_point timestamp;  // request start, wall clock
    std::string method;
    std::string url;
    std::string host;   // as addressed, may include a port
    std::string path;   // without query
    http::HeaderList requestHeaders;
    std::string requestBody;   // capped copy
    uint64_t requestSize{0};
    int statusCode{0};
    std::string statusText;
    http::HeaderList responseHeaders;
    std::string responseBody;  // capped copy, empty for excluded content types
    uint64_t responseSize{0};
    std::chrono::milliseconds duration{0};
    bool isHttps{false};
    std::string tlsVersion;
    std::string tlsCipher;
    std::string sourceIp;
    uint16_t sourcePort{0};
    std::string error;  // set when no response was produced; statusCode stays 0

    std::string content_type() const;
    bool is_success() const { return statusCode >= 200 && statusCode < 300; }
    bool is_redirect() const { return statusCode >= 300 && statusCode < 400; }
    bool is_client_error() const { return statusCode >= 400 && statusCode < 500; }
    bool is_server_error() const { return statusCode >= 500 && statusCode < 600; }
};
using CapturePtr = std::shared_ptr<const CapturedRequest>;

// Zero or empty fields are not applied.
struct FilterOptions {
    std::string method;
    std::string host;          // exact or "*.suffix"
    std::string pathPrefix;
    int statusMin{0};
    int statusMax{0};
    std::string contentType;   // prefix of the response Content-Type
    std::string search;        // free text over url, headers and textual bodies
    uint64_t minSize{0};       // response size bounds
    uint64_t maxSize{0};
    std::chrono::system_clock::time_point after{};
    std::chrono::system_clock::time_point before{};
    bool httpsOnly{false};
    bool httpOnly{false};
    std::size_t offset{0};
    std::size_t limit{0};
};

struct CaptureStats {
    std::size_t totalCount{0};
    uint64_t totalRequestSize{0};
    uint64_t totalResponseSize{0};
    std::map<std::string, std::size_t> methodCounts;
    std::map<int, std::size_t> statusCounts;
    std::map<std::string, std::size_t> hostCounts;
    std::chrono::milliseconds avgDuration{0};
    std::chrono::system_clock::time_point oldest{};
    std::chrono::system_clock::time_point newest{};
};

class CaptureListener {
public:
    virtual ~CaptureListener() = default;
    virtual void on_capture(const CapturePtr& capture) = 0;
};
}
