#include "trafficlens/core/net/UpstreamConnector.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace trafficlens::core::net {
std::optional<Socket> UpstreamConnector::connect(const std::string& host, uint16_t port, int timeout_ms, std::string* error) {
    auto port_str = std::to_string(port);
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        if (error) *error = "dial tcp " + host + ":" + port_str + ": lookup " + host + ": " + ::gai_strerror(gai);
        return std::nullopt;
    }
    std::string last = "no addresses";
    for (auto p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last = std::strerror(errno); continue; }
        int flags = fcntl(s, F_GETFL, 0); fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int r = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (r < 0) {
            if (errno != EINPROGRESS) { last = std::strerror(errno); ::close(s); continue; }
            pollfd pfd{}; pfd.fd = s; pfd.events = POLLOUT;
            int pr;
            do { pr = ::poll(&pfd, 1, timeout_ms); } while (pr < 0 && errno == EINTR);
            if (pr <= 0) { last = pr == 0 ? "i/o timeout" : std::strerror(errno); ::close(s); continue; }
            int soerr = 0; socklen_t len = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len) != 0 || soerr != 0) {
                last = std::strerror(soerr ? soerr : errno); ::close(s); continue;
            }
        }
        fcntl(s, F_SETFL, flags);
        int yes = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
        ::freeaddrinfo(res);
        return Socket(s);
    }
    if (res) ::freeaddrinfo(res);
    if (error) *error = "dial tcp " + host + ":" + port_str + ": " + last;
    return std::nullopt;
}
}
