/**
 * Server string parser.
 *
 * Splits "host:port{ip}" style strings into their components. The branch
 * order below is observable (it decides which port wins when several
 * parts carry one) and must not be reordered:
 *
 *   1. strip the "{ip}" suffix
 *   2. "[v6]:port" in the host part       -> host + port, done
 *   3. "[v6]:port" inside the forced ip   -> forced ip + port
 *   4. plain "host:port" on the host part -> host + port (overwrites 3)
 */

#include "tlsscan/target.hpp"
#include "tlsscan/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

namespace tlsscan {

static const char* const kBadPortMsg = "Not a valid host:port";
static const char* const kNoIpv6Msg  = "IPv6 is not supported on this platform";

// ============================================================================
// Helpers
// ============================================================================

// Split on every occurrence of `sep`, keeping empty fields.
static std::vector<std::string> split_all(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

static bool contains(const std::string& s, char c) {
    return s.find(c) != std::string::npos;
}

/**
 * Integer conversion for the port field. Surrounding whitespace and a
 * leading sign are tolerated; anything else, or a value outside
 * [1, 65535], is a bad port.
 */
static int parse_port(const std::string& field) {
    std::string::size_type b = 0, e = field.size();
    while (b < e && std::isspace(static_cast<unsigned char>(field[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(field[e - 1]))) --e;
    const std::string t = field.substr(b, e - b);

    if (t.empty())
        throw TargetSyntaxError(FailureReason::BadPort, kBadPortMsg);

    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || !end || static_cast<std::size_t>(end - t.c_str()) != t.size())
        throw TargetSyntaxError(FailureReason::BadPort, kBadPortMsg);

    if (v < 1 || v > 65535)
        throw TargetSyntaxError(FailureReason::BadPort, kBadPortMsg);

    return static_cast<int>(v);
}

struct HostPort {
    std::string host;
    std::optional<int> port;
};

// "[addr]" or "[addr]:port"
static HostPort parse_ipv6_form(const std::string& s, bool ipv6_available) {
    if (!ipv6_available)
        throw TargetSyntaxError(FailureReason::PlatformUnsupported, kNoIpv6Msg);

    const auto around_close = split_all(s, ']');
    if (around_close.size() < 2)
        throw TargetSyntaxError(FailureReason::BadPort, kBadPortMsg);

    const auto around_open = split_all(around_close[0], '[');
    if (around_open.size() < 2)
        throw TargetSyntaxError(FailureReason::BadPort, kBadPortMsg);

    HostPort hp;
    hp.host = around_open[1];

    const std::string& tail = around_close[1];
    if (contains(tail, ':')) {
        hp.port = parse_port(split_all(tail, ':')[1]);
    }
    return hp;
}

// "host" or "host:port"; only the second ':'-field is read as the port.
static HostPort parse_plain_form(const std::string& s) {
    HostPort hp;
    if (contains(s, ':')) {
        const auto fields = split_all(s, ':');
        hp.host = fields[0];
        hp.port = parse_port(fields[1]);
    } else {
        hp.host = s;
    }
    return hp;
}


// ============================================================================
// Public API
// ============================================================================

bool platform_has_ipv6() {
    static const bool available = [] {
        int s = ::socket(AF_INET6, SOCK_STREAM, 0);
        if (s < 0)
            return errno != EAFNOSUPPORT;
        ::close(s);
        return true;
    }();
    return available;
}

ParsedTarget parse_target(const std::string& raw) {
    return parse_target(raw, platform_has_ipv6());
}

ParsedTarget parse_target(const std::string& raw, bool ipv6_available) {
    ParsedTarget target{};
    std::string host_part = raw;

    // Forced ip suffix
    if (contains(raw, '{') && contains(raw, '}')) {
        const auto fields = split_all(raw, '{');
        std::string ip = fields[1];
        std::string cleaned;
        cleaned.reserve(ip.size());
        for (char c : ip) {
            if (c != '}') cleaned.push_back(c);
        }
        target.forced_ip = cleaned;
        host_part = fields[0];
    }

    if (contains(host_part, '[')) {
        auto hp = parse_ipv6_form(host_part, ipv6_available);
        target.host = hp.host;
        target.port = hp.port;
        return target;
    }

    if (target.forced_ip && contains(*target.forced_ip, '[')) {
        auto hp = parse_ipv6_form(*target.forced_ip, ipv6_available);
        target.forced_ip = hp.host;
        target.port = hp.port;
    }

    auto hp = parse_plain_form(host_part);
    target.host = hp.host;
    target.port = hp.port;
    return target;
}

} // namespace tlsscan
