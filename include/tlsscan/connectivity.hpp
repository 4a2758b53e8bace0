#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tlsscan/config.hpp"
#include "tlsscan/errors.hpp"
#include "tlsscan/settings.hpp"
#include "tlsscan/target.hpp"

namespace tlsscan {

// ============================================================================
// Connectivity prober
// ============================================================================

/**
 * What the prober is asked to check for one target.
 */
struct ProbeRequest {
    std::string hostname;
    std::optional<std::string> forced_ip;              // Connect here instead of DNS
    int port{443};
    std::shared_ptr<const HttpTunnelSettings> tunnel;  // Proxy resolves the name
};

/**
 * Prober verdict. On failure `reason` and `error_msg` describe why.
 */
struct ProbeResult {
    bool ok{false};
    std::optional<std::string> ip_address;  // Empty when going through a proxy
    FailureReason reason{FailureReason::NameNotResolved};
    std::string error_msg;
};

/**
 * Resolves and validates one target before it is handed to the scanner.
 * Implementations report failures through ProbeResult and do not throw.
 */
class ConnectivityProber {
public:
    virtual ~ConnectivityProber() = default;
    virtual ProbeResult probe(const ProbeRequest& request) = 0;
};

/**
 * Prober backed by getaddrinfo() and blocking TCP connects.
 *
 * - forced ip: must be an IPv4/IPv6 literal
 * - no forced ip, no proxy: DNS lookup, first address wins
 * - proxy: no local lookup
 * - check_reachability: TCP connect to the target (or to the proxy),
 *   up to `retry_count` attempts, each bounded by `timeout_seconds`
 */
class SocketConnectivityProber : public ConnectivityProber {
public:
    SocketConnectivityProber(int timeout_seconds, int retry_count, bool check_reachability = true);

    ProbeResult probe(const ProbeRequest& request) override;

private:
    int timeout_seconds_;
    int retry_count_;
    bool check_reachability_;
};

/**
 * @return true if `ip` is a literal IPv4 or IPv6 address.
 */
bool is_ip_literal(const std::string& ip);


// ============================================================================
// Descriptors
// ============================================================================

struct DescriptorFields {
    std::string original_string;       // As typed by the user
    std::string hostname;
    std::optional<std::string> resolved_ip;
    int port{443};
    TlsWrappedProtocol tls_wrapped_protocol{TlsWrappedProtocol::PlainTls};
    std::optional<std::string> sni_override;
    std::optional<std::string> xmpp_to;
    std::shared_ptr<const ClientAuthCredentials> client_auth;
    std::shared_ptr<const HttpTunnelSettings> http_tunnel;
};

/**
 * Fully resolved description of one server, ready for the scanner.
 * Immutable: the protocol is changed by producing a new value through
 * with_protocol().
 */
class ServerConnectivityDescriptor {
public:
    explicit ServerConnectivityDescriptor(DescriptorFields fields) : f_(std::move(fields)) {}

    const std::string& original_string() const { return f_.original_string; }
    const std::string& hostname() const { return f_.hostname; }
    const std::optional<std::string>& resolved_ip() const { return f_.resolved_ip; }
    int port() const { return f_.port; }
    TlsWrappedProtocol tls_wrapped_protocol() const { return f_.tls_wrapped_protocol; }
    const std::optional<std::string>& sni_override() const { return f_.sni_override; }
    const std::optional<std::string>& xmpp_to() const { return f_.xmpp_to; }
    const std::shared_ptr<const ClientAuthCredentials>& client_auth() const { return f_.client_auth; }
    const std::shared_ptr<const HttpTunnelSettings>& http_tunnel() const { return f_.http_tunnel; }

    /** SNI override if one was configured, otherwise the hostname. */
    const std::string& server_name_indication() const;

    ServerConnectivityDescriptor with_protocol(TlsWrappedProtocol protocol) const;

    bool operator==(const ServerConnectivityDescriptor& other) const;
    bool operator!=(const ServerConnectivityDescriptor& other) const { return !(*this == other); }

private:
    DescriptorFields f_;
};

/**
 * A server string that could not be resolved, and why.
 */
struct FailedTarget {
    std::string original_string;
    FailureReason reason{FailureReason::BadPort};
    std::string error_msg;

    bool operator==(const FailedTarget& other) const {
        return original_string == other.original_string &&
               reason == other.reason &&
               error_msg == other.error_msg;
    }
    bool operator!=(const FailedTarget& other) const { return !(*this == other); }
};

/**
 * Both lists keep the relative order of the input strings.
 */
struct BatchResolution {
    std::vector<ServerConnectivityDescriptor> descriptors;
    std::vector<FailedTarget> failures;
};


// ============================================================================
// Resolution
// ============================================================================

/**
 * Build the descriptor for one parsed target using the shared settings.
 *
 * @throws ConnectivityError           prober rejected the target
 * @throws CrossTargetMisconfiguration forced ip with a proxy, or
 *                                     --xmpp_to on a non-XMPP protocol
 */
ServerConnectivityDescriptor make_descriptor(const std::string& original_string,
                                             const ParsedTarget& target,
                                             const ScanConfiguration& config,
                                             ConnectivityProber& prober);

/**
 * Final protocol for a descriptor: --starttls auto port deduction first,
 * then the --http_get override for port 443.
 */
TlsWrappedProtocol finalize_protocol(const ServerConnectivityDescriptor& descriptor,
                                     const ScanConfiguration& config);

/**
 * Resolve every server string, in order. Syntax and connectivity errors
 * become FailedTarget entries; a CrossTargetMisconfiguration aborts the
 * whole batch.
 *
 * @throws CrossTargetMisconfiguration
 */
BatchResolution resolve_all(const std::vector<std::string>& targets,
                            const ScanConfiguration& config,
                            ConnectivityProber& prober);

} // namespace tlsscan
