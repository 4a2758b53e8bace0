#pragma once
#include <optional>
#include <string>

namespace tlsscan {

/**
 * Result of splitting one server string taken from the command line.
 *
 * Accepted forms:
 *   host
 *   host:port
 *   [ipv6]
 *   [ipv6]:port
 * each optionally followed by "{ip}" to force the address to connect to
 * while keeping the hostname for SNI and reporting.
 */
struct ParsedTarget {
    std::string host;                  // Hostname, IPv4 or bare IPv6 address
    std::optional<std::string> forced_ip;
    std::optional<int> port;           // Unset = protocol default
};

/**
 * Parse a raw server string. Hostname syntax is not validated here;
 * name resolution happens later in the connectivity prober.
 *
 * @throws TargetSyntaxError (BadPort, PlatformUnsupported)
 */
ParsedTarget parse_target(const std::string& raw);

/**
 * Same as above with the platform IPv6 capability supplied by the caller.
 */
ParsedTarget parse_target(const std::string& raw, bool ipv6_available);

/**
 * @return true if an AF_INET6 socket can be opened on this host.
 * Probed once and cached for the lifetime of the process.
 */
bool platform_has_ipv6();

} // namespace tlsscan
