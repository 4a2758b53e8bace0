/**
 * Target batch resolver.
 *
 * Walks the server strings in order and splits them into descriptors and
 * failures. Per-target problems (syntax, DNS, unreachable port) are
 * collected; a global setting that clashes with a target aborts the run.
 * Protocol adjustments that depend on the resolved port are applied in a
 * separate pass once every target has been classified.
 */

#include "tlsscan/connectivity.hpp"

namespace tlsscan {

// ============================================================================
// ServerConnectivityDescriptor
// ============================================================================

const std::string& ServerConnectivityDescriptor::server_name_indication() const {
    return f_.sni_override ? *f_.sni_override : f_.hostname;
}

ServerConnectivityDescriptor ServerConnectivityDescriptor::with_protocol(TlsWrappedProtocol protocol) const {
    DescriptorFields copy = f_;
    copy.tls_wrapped_protocol = protocol;
    return ServerConnectivityDescriptor(std::move(copy));
}

bool ServerConnectivityDescriptor::operator==(const ServerConnectivityDescriptor& other) const {
    return f_.original_string == other.f_.original_string &&
           f_.hostname == other.f_.hostname &&
           f_.resolved_ip == other.f_.resolved_ip &&
           f_.port == other.f_.port &&
           f_.tls_wrapped_protocol == other.f_.tls_wrapped_protocol &&
           f_.sni_override == other.f_.sni_override &&
           f_.xmpp_to == other.f_.xmpp_to &&
           f_.client_auth == other.f_.client_auth &&
           f_.http_tunnel == other.f_.http_tunnel;
}


// ============================================================================
// Single target
// ============================================================================

ServerConnectivityDescriptor make_descriptor(const std::string& original_string,
                                             const ParsedTarget& target,
                                             const ScanConfiguration& config,
                                             ConnectivityProber& prober)
{
    DescriptorFields f;
    f.original_string = original_string;
    f.hostname = target.host;
    f.tls_wrapped_protocol = config.tls_wrapped_protocol;
    f.port = target.port ? *target.port : default_port(config.tls_wrapped_protocol);

    // "host{}" carries an empty forced ip, which means none
    std::optional<std::string> forced_ip = target.forced_ip;
    if (forced_ip && forced_ip->empty()) forced_ip.reset();

    if (forced_ip && config.http_tunnel)
        throw CrossTargetMisconfiguration("Cannot specify both an ip address and --https_tunnel.");

    ProbeRequest request;
    request.hostname = f.hostname;
    request.forced_ip = forced_ip;
    request.port = f.port;
    request.tunnel = config.http_tunnel;

    ProbeResult probed = prober.probe(request);
    if (!probed.ok)
        throw ConnectivityError(probed.reason, probed.error_msg);
    f.resolved_ip = probed.ip_address;

    f.sni_override = config.sni_override;
    f.xmpp_to = config.xmpp_to;
    if (f.xmpp_to && !is_xmpp(f.tls_wrapped_protocol))
        throw CrossTargetMisconfiguration("Can only specify xmpp_to for the XMPP StartTLS protocol.");

    f.client_auth = config.client_auth;
    f.http_tunnel = config.http_tunnel;
    return ServerConnectivityDescriptor(std::move(f));
}

TlsWrappedProtocol finalize_protocol(const ServerConnectivityDescriptor& descriptor,
                                     const ScanConfiguration& config)
{
    TlsWrappedProtocol protocol = descriptor.tls_wrapped_protocol();

    if (config.starttls_mode == StartTlsMode::Auto) {
        if (auto deduced = starttls_protocol_for_port(descriptor.port()))
            protocol = *deduced;
    }

    if (config.http_get_shortcut && descriptor.port() == 443)
        protocol = TlsWrappedProtocol::Https;

    return protocol;
}


// ============================================================================
// Batch
// ============================================================================

BatchResolution resolve_all(const std::vector<std::string>& targets,
                            const ScanConfiguration& config,
                            ConnectivityProber& prober)
{
    std::vector<ServerConnectivityDescriptor> resolved;
    resolved.reserve(targets.size());

    BatchResolution batch;

    for (const auto& server_string : targets) {
        try {
            const ParsedTarget parsed = parse_target(server_string);
            resolved.push_back(make_descriptor(server_string, parsed, config, prober));
        } catch (const TargetError& e) {
            // Bad syntax, DNS failure, unreachable port: skip this target only
            batch.failures.push_back({server_string, e.reason(), e.what()});
        }
    }

    batch.descriptors.reserve(resolved.size());
    for (const auto& d : resolved)
        batch.descriptors.push_back(d.with_protocol(finalize_protocol(d, config)));

    return batch;
}

} // namespace tlsscan
