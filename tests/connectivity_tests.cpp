#include "tlsscan/connectivity.hpp"
#include "test_harness.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace tlsscan;

namespace {

/**
 * Prober that never touches the network. Hostnames containing
 * "unresolvable" fail DNS; everything else resolves to 192.0.2.10.
 */
class FakeProber : public ConnectivityProber {
public:
    std::vector<ProbeRequest> requests;

    ProbeResult probe(const ProbeRequest& request) override {
        requests.push_back(request);

        ProbeResult result;
        if (request.hostname.find("unresolvable") != std::string::npos) {
            result.reason = FailureReason::NameNotResolved;
            result.error_msg = "Could not resolve " + request.hostname;
            return result;
        }
        result.ok = true;
        if (request.forced_ip)
            result.ip_address = *request.forced_ip;
        else if (!request.tunnel)
            result.ip_address = "192.0.2.10";
        return result;
    }
};

// Listening TCP socket on 127.0.0.1, ephemeral port. Connects complete
// through the backlog without an accept() call.
class LocalListener {
public:
    LocalListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LocalListener() { close(); }

    void close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    int port() const { return port_; }

private:
    int fd_{-1};
    int port_{0};
};

ScanConfiguration plain_config() {
    return ScanConfiguration{};
}

} // namespace

// ============================================================================
// Batch resolution
// ============================================================================

bool test_bad_port_becomes_failure() {
    FakeProber prober;
    auto batch = resolve_all({"badhost:notaport"}, plain_config(), prober);
    return batch.descriptors.empty() && batch.failures.size() == 1 &&
           batch.failures[0].original_string == "badhost:notaport" &&
           batch.failures[0].reason == FailureReason::BadPort &&
           batch.failures[0].error_msg == "Not a valid host:port" &&
           prober.requests.empty();
}

bool test_default_port_follows_protocol() {
    FakeProber prober;
    auto plain = resolve_all({"example.com"}, plain_config(), prober);

    ScanConfiguration smtp;
    smtp.tls_wrapped_protocol = TlsWrappedProtocol::StartTlsSmtp;
    smtp.starttls_mode = StartTlsMode::Explicit;
    auto mail = resolve_all({"mail.example.com"}, smtp, prober);

    return plain.descriptors.size() == 1 && plain.descriptors[0].port() == 443 &&
           mail.descriptors.size() == 1 && mail.descriptors[0].port() == 25 &&
           mail.descriptors[0].tls_wrapped_protocol() == TlsWrappedProtocol::StartTlsSmtp;
}

bool test_starttls_auto_deduces_from_port() {
    ScanConfiguration config;
    config.starttls_mode = StartTlsMode::Auto;
    FakeProber prober;
    auto batch = resolve_all({"mail.example.com:587", "imap.example.com:143", "www.example.com"},
                             config, prober);
    return batch.descriptors.size() == 3 &&
           batch.descriptors[0].tls_wrapped_protocol() == TlsWrappedProtocol::StartTlsSmtp &&
           batch.descriptors[1].tls_wrapped_protocol() == TlsWrappedProtocol::StartTlsImap &&
           batch.descriptors[2].tls_wrapped_protocol() == TlsWrappedProtocol::PlainTls;
}

bool test_http_get_on_443_is_https() {
    ScanConfiguration config;
    config.http_get_shortcut = true;
    FakeProber prober;
    auto batch = resolve_all({"www.example.com:443", "www.example.com:8443", "www.example.com"},
                             config, prober);
    return batch.descriptors.size() == 3 &&
           batch.descriptors[0].tls_wrapped_protocol() == TlsWrappedProtocol::Https &&
           batch.descriptors[1].tls_wrapped_protocol() == TlsWrappedProtocol::PlainTls &&
           batch.descriptors[2].tls_wrapped_protocol() == TlsWrappedProtocol::Https;
}

bool test_http_get_overrides_auto_starttls() {
    ScanConfiguration config;
    config.starttls_mode = StartTlsMode::Auto;
    config.http_get_shortcut = true;
    FakeProber prober;
    auto batch = resolve_all({"mail.example.com:25", "www.example.com:443"}, config, prober);
    return batch.descriptors.size() == 2 &&
           batch.descriptors[0].tls_wrapped_protocol() == TlsWrappedProtocol::StartTlsSmtp &&
           batch.descriptors[1].tls_wrapped_protocol() == TlsWrappedProtocol::Https;
}

bool test_partition_is_total_and_ordered() {
    const std::vector<std::string> targets = {
        "a.example.com", "bad:x", "b.unresolvable.example", "c.example.com:8443", "d.example.com:0"
    };
    FakeProber prober;
    auto batch = resolve_all(targets, plain_config(), prober);

    if (batch.descriptors.size() + batch.failures.size() != targets.size()) return false;
    return batch.descriptors[0].original_string() == "a.example.com" &&
           batch.descriptors[1].original_string() == "c.example.com:8443" &&
           batch.failures[0].original_string == "bad:x" &&
           batch.failures[1].original_string == "b.unresolvable.example" &&
           batch.failures[1].reason == FailureReason::NameNotResolved &&
           batch.failures[2].original_string == "d.example.com:0";
}

bool test_duplicates_are_kept() {
    FakeProber prober;
    auto batch = resolve_all({"example.com", "example.com"}, plain_config(), prober);
    return batch.descriptors.size() == 2 && batch.descriptors[0] == batch.descriptors[1];
}

bool test_resolution_is_deterministic() {
    const std::vector<std::string> targets = {"a.example.com", "bad:x", "c.example.com:8443{192.0.2.5}"};
    ScanConfiguration config;
    config.http_get_shortcut = true;

    FakeProber p1, p2;
    auto first = resolve_all(targets, config, p1);
    auto second = resolve_all(targets, config, p2);
    return first.descriptors == second.descriptors && first.failures == second.failures;
}

bool test_forced_ip_passed_to_prober() {
    FakeProber prober;
    auto batch = resolve_all({"example.com:443{192.0.2.99}"}, plain_config(), prober);
    return prober.requests.size() == 1 &&
           prober.requests[0].forced_ip == std::optional<std::string>("192.0.2.99") &&
           prober.requests[0].port == 443 &&
           batch.descriptors.size() == 1 &&
           batch.descriptors[0].resolved_ip() == std::optional<std::string>("192.0.2.99");
}

bool test_empty_forced_ip_means_none() {
    FakeProber prober;
    auto batch = resolve_all({"example.com{}"}, plain_config(), prober);
    return prober.requests.size() == 1 && !prober.requests[0].forced_ip &&
           batch.descriptors.size() == 1 && batch.descriptors[0].hostname() == "example.com";
}

bool test_forced_ip_with_tunnel_aborts_batch() {
    ScanConfiguration config;
    config.http_tunnel = std::make_shared<const HttpTunnelSettings>(
        HttpTunnelSettings::from_url("http://proxy:3128"));
    FakeProber prober;
    try {
        resolve_all({"a.example.com", "b.example.com{192.0.2.1}"}, config, prober);
    } catch (const CrossTargetMisconfiguration& e) {
        return e.kind() == ConfigErrorKind::CrossTargetMisconfiguration &&
               std::string(e.what()) == "Cannot specify both an ip address and --https_tunnel.";
    }
    return false;
}

bool test_tunnel_descriptor() {
    ScanConfiguration config;
    config.http_tunnel = std::make_shared<const HttpTunnelSettings>(
        HttpTunnelSettings::from_url("http://proxy:3128"));
    FakeProber prober;
    auto batch = resolve_all({"example.com"}, config, prober);
    return batch.descriptors.size() == 1 &&
           !batch.descriptors[0].resolved_ip() &&
           batch.descriptors[0].http_tunnel() == config.http_tunnel &&
           prober.requests[0].tunnel == config.http_tunnel;
}

bool test_xmpp_to_requires_xmpp() {
    ScanConfiguration config;
    config.xmpp_to = "jabber.example.com";
    FakeProber prober;
    try {
        resolve_all({"example.com:5222"}, config, prober);
        return false;
    } catch (const CrossTargetMisconfiguration&) {
    }

    // Auto mode decides the protocol after the check, so it is rejected too
    config.starttls_mode = StartTlsMode::Auto;
    try {
        resolve_all({"example.com:5222"}, config, prober);
        return false;
    } catch (const CrossTargetMisconfiguration&) {
    }

    config.starttls_mode = StartTlsMode::Explicit;
    config.tls_wrapped_protocol = TlsWrappedProtocol::StartTlsXmpp;
    auto batch = resolve_all({"example.com"}, config, prober);
    return batch.descriptors.size() == 1 &&
           batch.descriptors[0].xmpp_to() == std::optional<std::string>("jabber.example.com") &&
           batch.descriptors[0].port() == 5222;
}

bool test_failed_target_does_not_hit_misconfiguration() {
    // The prober rejects the target before the xmpp_to check runs
    ScanConfiguration config;
    config.xmpp_to = "jabber.example.com";
    FakeProber prober;
    auto batch = resolve_all({"host.unresolvable.example"}, config, prober);
    return batch.descriptors.empty() && batch.failures.size() == 1;
}

bool test_sni() {
    FakeProber prober;
    auto plain = resolve_all({"example.com"}, plain_config(), prober);

    ScanConfiguration config;
    config.sni_override = "front.example.net";
    auto overridden = resolve_all({"example.com"}, config, prober);

    return plain.descriptors[0].server_name_indication() == "example.com" &&
           overridden.descriptors[0].server_name_indication() == "front.example.net";
}

bool test_with_protocol_leaves_original() {
    DescriptorFields f;
    f.original_string = "example.com";
    f.hostname = "example.com";
    f.port = 443;
    const ServerConnectivityDescriptor d(f);
    const auto https = d.with_protocol(TlsWrappedProtocol::Https);
    return d.tls_wrapped_protocol() == TlsWrappedProtocol::PlainTls &&
           https.tls_wrapped_protocol() == TlsWrappedProtocol::Https &&
           https.hostname() == d.hostname() && d != https;
}


// ============================================================================
// Socket prober
// ============================================================================

bool test_ip_literals() {
    return is_ip_literal("127.0.0.1") && is_ip_literal("::1") && is_ip_literal("2001:db8::5") &&
           !is_ip_literal("999.1.1.1") && !is_ip_literal("example.com") && !is_ip_literal("");
}

bool test_socket_prober_reachable() {
    LocalListener listener;
    SocketConnectivityProber prober(1, 1);

    ProbeRequest request;
    request.hostname = "localhost";
    request.forced_ip = "127.0.0.1";
    request.port = listener.port();

    auto result = prober.probe(request);
    return result.ok && result.ip_address == std::optional<std::string>("127.0.0.1");
}

bool test_socket_prober_closed_port() {
    LocalListener listener;
    const int port = listener.port();
    listener.close();

    SocketConnectivityProber prober(1, 2);
    ProbeRequest request;
    request.hostname = "localhost";
    request.forced_ip = "127.0.0.1";
    request.port = port;

    auto result = prober.probe(request);
    return !result.ok && result.reason == FailureReason::ConnectionFailed && !result.error_msg.empty();
}

bool test_socket_prober_invalid_forced_ip() {
    SocketConnectivityProber prober(1, 1);
    ProbeRequest request;
    request.hostname = "example.com";
    request.forced_ip = "999.1.1.1";
    request.port = 443;

    auto result = prober.probe(request);
    return !result.ok && result.reason == FailureReason::InvalidIpAddress &&
           result.error_msg == "'999.1.1.1' is not a valid IP address for example.com";
}

bool test_socket_prober_unresolvable_name() {
    SocketConnectivityProber prober(1, 1, false);
    ProbeRequest request;
    request.hostname = "no-such-host.invalid";
    request.port = 443;

    auto result = prober.probe(request);
    return !result.ok && result.reason == FailureReason::NameNotResolved;
}

bool test_socket_prober_tunnel_skips_lookup() {
    SocketConnectivityProber prober(1, 1, false);
    ProbeRequest request;
    request.hostname = "no-such-host.invalid";
    request.port = 443;
    request.tunnel = std::make_shared<const HttpTunnelSettings>(
        HttpTunnelSettings::from_url("http://proxy.invalid:3128"));

    auto result = prober.probe(request);
    return result.ok && !result.ip_address;
}

bool test_invalid_forced_ip_collected_in_batch() {
    SocketConnectivityProber prober(1, 1, false);
    auto batch = resolve_all({"example.com{not-an-ip}"}, plain_config(), prober);
    return batch.descriptors.empty() && batch.failures.size() == 1 &&
           batch.failures[0].reason == FailureReason::InvalidIpAddress;
}

int main() {
    std::cout << "Running connectivity tests...\n";

    run_test("Bad port becomes failure", test_bad_port_becomes_failure);
    run_test("Default port follows protocol", test_default_port_follows_protocol);
    run_test("StartTLS auto from port", test_starttls_auto_deduces_from_port);
    run_test("http_get on 443 is HTTPS", test_http_get_on_443_is_https);
    run_test("http_get overrides auto", test_http_get_overrides_auto_starttls);
    run_test("Partition total and ordered", test_partition_is_total_and_ordered);
    run_test("Duplicates kept", test_duplicates_are_kept);
    run_test("Deterministic", test_resolution_is_deterministic);
    run_test("Forced IP passed to prober", test_forced_ip_passed_to_prober);
    run_test("Empty forced IP", test_empty_forced_ip_means_none);
    run_test("Forced IP with tunnel aborts", test_forced_ip_with_tunnel_aborts_batch);
    run_test("Tunnel descriptor", test_tunnel_descriptor);
    run_test("xmpp_to requires XMPP", test_xmpp_to_requires_xmpp);
    run_test("Failed target skips xmpp_to check", test_failed_target_does_not_hit_misconfiguration);
    run_test("SNI", test_sni);
    run_test("with_protocol", test_with_protocol_leaves_original);

    run_test("IP literals", test_ip_literals);
    run_test("Socket prober reachable", test_socket_prober_reachable);
    run_test("Socket prober closed port", test_socket_prober_closed_port);
    run_test("Socket prober invalid forced IP", test_socket_prober_invalid_forced_ip);
    run_test("Socket prober unresolvable", test_socket_prober_unresolvable_name);
    run_test("Socket prober tunnel", test_socket_prober_tunnel_skips_lookup);
    run_test("Invalid forced IP in batch", test_invalid_forced_ip_collected_in_batch);

    return finish("Connectivity tests");
}
