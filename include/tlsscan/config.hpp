#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tlsscan/options.hpp"
#include "tlsscan/settings.hpp"

namespace tlsscan {

enum class StartTlsMode {
    None,      // Direct TLS
    Explicit,  // Protocol given on the command line
    Auto       // Protocol deduced from each target's port
};

/**
 * Validated, normalized settings shared by every target of a run.
 * Built once by resolve_configuration() and only handed out as
 * shared_ptr<const>.
 */
struct ScanConfiguration {
    TlsWrappedProtocol tls_wrapped_protocol{TlsWrappedProtocol::PlainTls};
    StartTlsMode starttls_mode{StartTlsMode::None};

    std::optional<std::string> sni_override;
    std::optional<std::string> xmpp_to;

    std::shared_ptr<const ClientAuthCredentials> client_auth;
    std::shared_ptr<const HttpTunnelSettings> http_tunnel;

    int timeout_seconds{kDefaultTimeoutSeconds};
    int retry_count{kDefaultRetryCount};  // Always >= 1

    bool quiet{false};
    std::optional<std::string> xml_sink;   // "-" = stdout
    std::optional<std::string> json_sink;  // "-" = stdout

    bool http_get_shortcut{false};
};

/**
 * Output of the configuration step: the frozen configuration, the final
 * ordered list of server strings, and the option values after the
 * --regular shortcut was expanded (plugins read their flags from there).
 */
struct ResolvedConfiguration {
    std::shared_ptr<const ScanConfiguration> config;
    std::vector<std::string> targets;
    OptionValues options;
};

/**
 * Accepted --starttls values, in the order shown to the user.
 */
const std::vector<std::string>& starttls_allowed_values();

/**
 * Protocol for an explicit --starttls token ("smtp", "imap", ...).
 * "auto" and unknown tokens return nullopt.
 */
std::optional<TlsWrappedProtocol> starttls_protocol_for_name(const std::string& name);

/**
 * Protocol deduced from a port when --starttls auto is used
 * (25/587 SMTP, 143/220 IMAP, ...).
 */
std::optional<TlsWrappedProtocol> starttls_protocol_for_port(int port);

/**
 * Validate the command line and freeze it into a ScanConfiguration.
 *
 * Checks run in a fixed order and the first failure is thrown:
 * target sourcing, --regular expansion, output sinks, client auth,
 * proxy, StartTLS, retries. Nothing is resolved over the network.
 *
 * @throws ConfigurationError
 */
ResolvedConfiguration resolve_configuration(OptionValues options,
                                            std::vector<std::string> positional_targets);

/**
 * Read server strings from a --targets_in file: one per line, trimmed,
 * blank lines and lines starting with '#' skipped.
 *
 * @throws ConfigurationError (UnreadableTargetsFile)
 */
std::vector<std::string> read_targets_file(const std::string& path);

} // namespace tlsscan
