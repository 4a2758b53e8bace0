/**
 * Configuration resolver.
 *
 * Turns raw option values into one immutable ScanConfiguration. Every
 * check here is global: a failure aborts the run before a single target
 * is parsed or probed. The check order is part of the contract (the
 * first failing check decides the error reported to the user).
 */

#include "tlsscan/config.hpp"
#include "tlsscan/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace tlsscan {

// ============================================================================
// StartTLS lookup tables
// ============================================================================

const std::vector<std::string>& starttls_allowed_values() {
    static const std::vector<std::string> values = {
        "smtp", "xmpp", "xmpp_server", "pop3", "ftp", "imap", "ldap", "rdp", "postgres", "auto"
    };
    return values;
}

std::optional<TlsWrappedProtocol> starttls_protocol_for_name(const std::string& name) {
    static const std::unordered_map<std::string, TlsWrappedProtocol> by_name = {
        {"smtp",        TlsWrappedProtocol::StartTlsSmtp},
        {"xmpp",        TlsWrappedProtocol::StartTlsXmpp},
        {"xmpp_server", TlsWrappedProtocol::StartTlsXmppServer},
        {"pop3",        TlsWrappedProtocol::StartTlsPop3},
        {"imap",        TlsWrappedProtocol::StartTlsImap},
        {"ftp",         TlsWrappedProtocol::StartTlsFtp},
        {"ldap",        TlsWrappedProtocol::StartTlsLdap},
        {"rdp",         TlsWrappedProtocol::StartTlsRdp},
        {"postgres",    TlsWrappedProtocol::StartTlsPostgres},
    };
    auto it = by_name.find(name);
    if (it == by_name.end()) return std::nullopt;
    return it->second;
}

std::optional<TlsWrappedProtocol> starttls_protocol_for_port(int port) {
    static const std::unordered_map<int, TlsWrappedProtocol> by_port = {
        {25,   TlsWrappedProtocol::StartTlsSmtp},
        {587,  TlsWrappedProtocol::StartTlsSmtp},
        {5222, TlsWrappedProtocol::StartTlsXmpp},
        {5269, TlsWrappedProtocol::StartTlsXmppServer},
        {109,  TlsWrappedProtocol::StartTlsPop3},
        {110,  TlsWrappedProtocol::StartTlsPop3},
        {143,  TlsWrappedProtocol::StartTlsImap},
        {220,  TlsWrappedProtocol::StartTlsImap},
        {21,   TlsWrappedProtocol::StartTlsFtp},
        {389,  TlsWrappedProtocol::StartTlsLdap},
        {3268, TlsWrappedProtocol::StartTlsLdap},
        {3389, TlsWrappedProtocol::StartTlsRdp},
        {5432, TlsWrappedProtocol::StartTlsPostgres},
    };
    auto it = by_port.find(port);
    if (it == by_port.end()) return std::nullopt;
    return it->second;
}

static std::string starttls_usage() {
    std::string list;
    for (const auto& v : starttls_allowed_values()) {
        if (!list.empty()) list += " , ";
        list += v;
    }
    return "StartTLS should be one of: " + list +
           ". The 'auto' option will cause the protocol (ftp, imap, etc.) to be deduced "
           "from the supplied port number, for each target server.";
}


// ============================================================================
// Helpers
// ============================================================================

// Present and non-empty, like a truthy string on the command line.
static std::optional<std::string> non_empty_text(const OptionValues& options, const std::string& dest) {
    auto v = options.text(dest);
    if (v && v->empty()) return std::nullopt;
    return v;
}

static std::string trim(const std::string& s) {
    std::string::size_type b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> read_targets_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError(ConfigErrorKind::UnreadableTargetsFile,
                                 "Can't read targets from input file '" + path + "'.");
    }

    std::vector<std::string> targets;
    std::string line;
    while (std::getline(f, line)) {
        const std::string t = trim(line);
        if (t.empty()) continue;          // blank
        if (line[0] == '#') continue;     // comment
        targets.push_back(t);
    }

    if (f.bad()) {
        throw ConfigurationError(ConfigErrorKind::UnreadableTargetsFile,
                                 "Can't read targets from input file '" + path + "'.");
    }
    return targets;
}


// ============================================================================
// Resolver
// ============================================================================

ResolvedConfiguration resolve_configuration(OptionValues options,
                                            std::vector<std::string> positional_targets)
{
    auto config = std::make_shared<ScanConfiguration>();

    // -------------------------------------------------------------
    // 1. Targets: command line or --targets_in, never both
    // -------------------------------------------------------------
    std::vector<std::string> targets = std::move(positional_targets);
    if (auto targets_in = non_empty_text(options, "targets_in")) {
        if (!targets.empty()) {
            throw ConfigurationError(ConfigErrorKind::MutuallyExclusiveInputs,
                                     "Cannot use --targets_in and specify targets within the command line.");
        }
        targets = read_targets_file(*targets_in);
    }

    if (targets.empty())
        throw ConfigurationError(ConfigErrorKind::NoTargets, "No targets to scan.");

    // -------------------------------------------------------------
    // 2. --regular shortcut
    // -------------------------------------------------------------
    if (options.flag("regular")) {
        options.set_flag("regular", false);
        for (const auto& name : regular_scan_flags())
            options.set_flag(name, true);
    }

    // -------------------------------------------------------------
    // 3. Output sinks
    // -------------------------------------------------------------
    const auto xml_sink  = non_empty_text(options, "xml_file");
    const auto json_sink = non_empty_text(options, "json_file");
    const bool quiet = options.flag("quiet");
    const bool xml_stdout  = xml_sink && *xml_sink == "-";
    const bool json_stdout = json_sink && *json_sink == "-";

    if (xml_stdout && quiet)
        throw ConfigurationError(ConfigErrorKind::OutputSinkConflict, "Cannot use --quiet with --xml_out -.");
    if (json_stdout && quiet)
        throw ConfigurationError(ConfigErrorKind::OutputSinkConflict, "Cannot use --quiet with --json_out -.");
    if (xml_stdout && json_stdout)
        throw ConfigurationError(ConfigErrorKind::OutputSinkConflict, "Cannot use --xml_out - with --json_out -.");

    // -------------------------------------------------------------
    // 4. Client certificate
    // -------------------------------------------------------------
    const auto cert = non_empty_text(options, "cert");
    const auto key  = non_empty_text(options, "key");
    if (cert.has_value() != key.has_value()) {
        throw ConfigurationError(ConfigErrorKind::ClientAuthMismatch,
                                 "No private key or certificate file were given. See --cert and --key.");
    }

    if (cert) {
        const std::string keyform = options.text("keyform").value_or("PEM");
        KeyFormat format;
        if (keyform == "DER") {
            format = KeyFormat::DER;
        } else if (keyform == "PEM") {
            format = KeyFormat::PEM;
        } else {
            throw ConfigurationError(ConfigErrorKind::InvalidKeyFormat, "--keyform should be DER or PEM.");
        }

        try {
            config->client_auth = std::make_shared<const ClientAuthCredentials>(
                *cert, *key, format, options.text("keypass").value_or(""));
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(ConfigErrorKind::InvalidCredential,
                                     std::string("Invalid client authentication settings: ") + e.what() + ".");
        }
    }

    // -------------------------------------------------------------
    // 5. HTTP CONNECT proxy
    // -------------------------------------------------------------
    if (auto url = non_empty_text(options, "https_tunnel")) {
        try {
            config->http_tunnel = std::make_shared<const HttpTunnelSettings>(HttpTunnelSettings::from_url(*url));
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(ConfigErrorKind::InvalidProxyUrl,
                                     std::string("Invalid proxy URL for --https_tunnel: ") + e.what() + ".");
        }
    }

    // -------------------------------------------------------------
    // 6. StartTLS
    // -------------------------------------------------------------
    if (auto starttls = non_empty_text(options, "starttls")) {
        const auto& allowed = starttls_allowed_values();
        if (std::find(allowed.begin(), allowed.end(), *starttls) == allowed.end())
            throw ConfigurationError(ConfigErrorKind::InvalidStartTlsValue, starttls_usage());

        if (auto protocol = starttls_protocol_for_name(*starttls)) {
            config->tls_wrapped_protocol = *protocol;
            config->starttls_mode = StartTlsMode::Explicit;
        } else {
            // "auto": resolved per target once ports are known
            config->starttls_mode = StartTlsMode::Auto;
        }
    }

    // -------------------------------------------------------------
    // 7. Retries
    // -------------------------------------------------------------
    const int retries = options.integer("nb_retries").value_or(kDefaultRetryCount);
    if (retries < 1) {
        throw ConfigurationError(ConfigErrorKind::InvalidRetryCount,
                                 "Cannot have a number smaller than 1 for --nb_retries.");
    }

    config->retry_count = retries;
    config->timeout_seconds = options.integer("timeout").value_or(kDefaultTimeoutSeconds);
    config->sni_override = non_empty_text(options, "sni");
    config->xmpp_to = non_empty_text(options, "xmpp_to");
    config->quiet = quiet;
    config->xml_sink = xml_sink;
    config->json_sink = json_sink;
    config->http_get_shortcut = options.flag("http_get");

    ResolvedConfiguration resolved;
    resolved.config = std::move(config);
    resolved.targets = std::move(targets);
    resolved.options = std::move(options);
    return resolved;
}

} // namespace tlsscan
