/**
 * POSIX connectivity prober.
 *
 * Uses:
 *   - inet_pton() to validate forced {ip} literals
 *   - getaddrinfo(AF_UNSPEC) for name resolution (first answer wins)
 *   - blocking TCP connect() bounded by SO_SNDTIMEO for reachability
 *
 * Everything is synchronous; one target is probed at a time.
 */

#include "tlsscan/connectivity.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace tlsscan {

// ============================================================================
// Helpers
// ============================================================================

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { if (ai) freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Closes the descriptor on scope exit.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }
private:
    int fd_;
};

bool is_ip_literal(const std::string& ip) {
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, ip.c_str(), &v4) == 1 ||
           inet_pton(AF_INET6, ip.c_str(), &v6) == 1;
}

static AddrInfoPtr lookup(const std::string& host, int port, int flags) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = flags;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        if (res) freeaddrinfo(res);
        return AddrInfoPtr{};
    }
    return AddrInfoPtr(res);
}

static std::string numeric_host(const addrinfo* ai) {
    char buf[NI_MAXHOST];
    if (getnameinfo(ai->ai_addr, ai->ai_addrlen, buf, sizeof(buf), nullptr, 0, NI_NUMERICHOST) != 0)
        return "";
    return buf;
}

// One connect() against every address of `host`; true on the first success.
static bool try_connect_once(const std::string& host, int port, int timeout_seconds) {
    AddrInfoPtr res = lookup(host, port, 0);
    if (!res) return false;

    for (addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        SocketGuard s(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (s.get() < 0) continue;

        timeval tv{};
        tv.tv_sec = std::max(1, timeout_seconds);
        ::setsockopt(s.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        ::setsockopt(s.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        if (::connect(s.get(), ai->ai_addr, ai->ai_addrlen) == 0)
            return true;
    }
    return false;
}


// ============================================================================
// SocketConnectivityProber
// ============================================================================

SocketConnectivityProber::SocketConnectivityProber(int timeout_seconds,
                                                   int retry_count,
                                                   bool check_reachability)
    : timeout_seconds_(timeout_seconds),
      retry_count_(retry_count),
      check_reachability_(check_reachability) {}

ProbeResult SocketConnectivityProber::probe(const ProbeRequest& request) {
    ProbeResult result{};

    // ---------------------------------------------------------------------
    // Address to connect to
    // ---------------------------------------------------------------------
    if (request.forced_ip) {
        if (!is_ip_literal(*request.forced_ip)) {
            result.reason = FailureReason::InvalidIpAddress;
            result.error_msg = "'" + *request.forced_ip + "' is not a valid IP address for " + request.hostname;
            return result;
        }
        result.ip_address = *request.forced_ip;
    } else if (!request.tunnel) {
        AddrInfoPtr res = lookup(request.hostname, request.port, 0);
        const std::string ip = res ? numeric_host(res.get()) : "";
        if (ip.empty()) {
            result.reason = FailureReason::NameNotResolved;
            result.error_msg = "Could not resolve " + request.hostname;
            return result;
        }
        result.ip_address = ip;
    }

    // ---------------------------------------------------------------------
    // Reachability (target directly, or the proxy)
    // ---------------------------------------------------------------------
    if (check_reachability_) {
        const std::string host = request.tunnel ? request.tunnel->hostname : *result.ip_address;
        const int port = request.tunnel ? request.tunnel->port : request.port;
        const int attempts = std::max(1, retry_count_);

        bool connected = false;
        for (int i = 0; i < attempts && !connected; ++i)
            connected = try_connect_once(host, port, timeout_seconds_);

        if (!connected) {
            result.reason = FailureReason::ConnectionFailed;
            result.error_msg = request.tunnel
                ? "Could not connect to the proxy at " + host + ":" + std::to_string(port)
                : "Could not connect to " + request.hostname + " at " + host + ":" + std::to_string(port);
            return result;
        }
    }

    result.ok = true;
    return result;
}

} // namespace tlsscan
