#include "trafficlens/core/net/Socket.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <charconv>

namespace trafficlens::core::net {
namespace {
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

inline bool set_nb(int fd, bool enabled) {
    int flags = fcntl(fd, F_GETFL, 0); if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

std::optional<Endpoint> endpoint_from(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    Endpoint ep;
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        if (!inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) return std::nullopt;
        ep.port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (!inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) return std::nullopt;
        ep.port = ntohs(in6->sin6_port);
    } else {
        return std::nullopt;
    }
    ep.host = buf;
    return ep;
}

bool wait_fd(int fd, short events, int timeout_ms) {
    pollfd p{}; p.fd = fd; p.events = events;
    for (;;) {
        int r = ::poll(&p, 1, timeout_ms);
        if (r < 0 && errno == EINTR) continue;
        return r > 0;
    }
}
}

std::string Endpoint::to_string() const {
    if (host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

std::optional<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port) {
    Endpoint ep; ep.port = default_port;
    std::string_view port_part;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        ep.host = std::string(text.substr(1, close - 1));
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::nullopt;
            port_part = rest.substr(1);
        }
    } else {
        auto colon = text.rfind(':');
        // More than one colon without brackets: bare IPv6 literal.
        if (colon != std::string_view::npos && text.find(':') == colon) {
            ep.host = std::string(text.substr(0, colon));
            port_part = text.substr(colon + 1);
        } else {
            ep.host = std::string(text);
        }
    }
    if (!port_part.empty()) {
        unsigned long p = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), p);
        if (ec != std::errc() || ptr != port_part.data() + port_part.size() || p > 65535) return std::nullopt;
        ep.port = static_cast<uint16_t>(p);
    }
    return ep;
}

Socket::Socket() = default;
Socket::Socket(int fd) : handle(fd) {}
Socket::Socket(Socket&& other) noexcept : handle(other.handle) { other.handle = -1; }
Socket& Socket::operator=(Socket&& other) noexcept { if (this != &other) { close(); handle = other.handle; other.handle = -1; } return *this; }
Socket::~Socket() { close(); }
bool Socket::valid() const { return handle >= 0; }
int Socket::native() const { return handle; }
void Socket::close() { if (handle >= 0) { ::close(handle); handle = -1; } }
void Socket::shutdown() { if (handle >= 0) ::shutdown(handle, SHUT_RDWR); }

bool Socket::set_timeouts(int read_ms, int write_ms) {
    if (!valid()) return false;
    timeval rtv{ read_ms / 1000, (read_ms % 1000) * 1000 };
    timeval wtv{ write_ms / 1000, (write_ms % 1000) * 1000 };
    bool ok = setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv)) == 0;
    ok = setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, &wtv, sizeof(wtv)) == 0 && ok;
    return ok;
}

bool Socket::wait_readable(int timeout_ms) const {
    if (!valid()) return false;
    return wait_fd(handle, POLLIN, timeout_ms);
}

std::optional<int> Socket::recv_some(std::vector<char>& buffer) {
    if (!valid() || buffer.empty()) return std::nullopt;
    for (;;) {
        auto r = ::recv(handle, buffer.data(), buffer.size(), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return std::nullopt;
        return static_cast<int>(r);
    }
}

bool Socket::send_all(std::string_view data) {
    if (!valid()) return false;
    const char* p = data.data(); size_t remaining = data.size();
    while (remaining > 0) {
        auto sent = ::send(handle, p, remaining, kSendFlags);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) return false;
        p += sent; remaining -= static_cast<size_t>(sent);
    }
    return true;
}

Listener::Listener() = default;
Listener::~Listener() { close(); }
bool Listener::valid() const { return handle >= 0; }
void Listener::close() { if (handle >= 0) { ::close(handle); handle = -1; } }

bool Listener::open(const std::string& host, uint16_t port, std::string* error) {
    close();
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM; hints.ai_flags = AI_PASSIVE;
    addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        if (error) *error = ::gai_strerror(gai);
        return false;
    }
    std::string last_error = "no usable address";
    // Prefer IPv4 for wildcard binds so "127.0.0.1" clients always reach us.
    for (int pass = 0; pass < 2 && handle < 0; ++pass) {
        for (auto p = res; p; p = p->ai_next) {
            if ((pass == 0) != (p->ai_family == AF_INET)) continue;
            int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
            if (fd < 0) { last_error = std::strerror(errno); continue; }
            int yes = 1;
            setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
            if (::bind(fd, p->ai_addr, p->ai_addrlen) < 0 || ::listen(fd, 128) < 0) {
                last_error = std::strerror(errno);
                ::close(fd);
                continue;
            }
            set_nb(fd, true);
            handle = fd;
            break;
        }
    }
    ::freeaddrinfo(res);
    if (handle < 0 && error) *error = last_error;
    return handle >= 0;
}

Socket Listener::accept(int timeout_ms, Endpoint* peer) {
    if (!valid()) return Socket();
    if (!wait_fd(handle, POLLIN, timeout_ms)) return Socket();
    sockaddr_storage addr{}; socklen_t len = sizeof(addr);
    int c = ::accept(handle, reinterpret_cast<sockaddr*>(&addr), &len);
    if (c < 0) return Socket();
    set_nb(c, false);
    int yes = 1;
    setsockopt(c, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    if (peer) {
        if (auto ep = endpoint_from(addr)) *peer = *ep;
    }
    return Socket(c);
}

std::optional<Endpoint> Listener::local_endpoint() const {
    if (!valid()) return std::nullopt;
    sockaddr_storage addr{}; socklen_t len = sizeof(addr);
    if (::getsockname(handle, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return std::nullopt;
    return endpoint_from(addr);
}
}
