#pragma once
#include <optional>
#include <string>

namespace tlsscan {

/**
 * How TLS is reached on the target: directly, or after an in-band
 * StartTLS upgrade of a cleartext protocol.
 */
enum class TlsWrappedProtocol {
    PlainTls,
    Https,
    StartTlsSmtp,
    StartTlsXmpp,
    StartTlsXmppServer,
    StartTlsPop3,
    StartTlsImap,
    StartTlsFtp,
    StartTlsLdap,
    StartTlsRdp,
    StartTlsPostgres
};

const char* to_string(TlsWrappedProtocol protocol);

/**
 * Port used when the server string does not carry one.
 */
int default_port(TlsWrappedProtocol protocol);

bool is_xmpp(TlsWrappedProtocol protocol);

enum class KeyFormat {
    DER,
    PEM
};

/**
 * Client certificate chain + private key used for TLS client auth.
 *
 * The constructor loads both files into a throw-away OpenSSL context so
 * that a bad path, a wrong passphrase or a key/certificate mismatch is
 * reported before any connection is attempted.
 *
 * @throws std::invalid_argument with a human-readable cause
 */
class ClientAuthCredentials {
public:
    ClientAuthCredentials(std::string certificate_chain_path,
                          std::string private_key_path,
                          KeyFormat key_format = KeyFormat::PEM,
                          std::string key_passphrase = "");

    const std::string& certificate_chain_path() const { return cert_path_; }
    const std::string& private_key_path() const { return key_path_; }
    KeyFormat key_format() const { return key_format_; }
    const std::string& key_passphrase() const { return key_passphrase_; }

private:
    std::string cert_path_;
    std::string key_path_;
    KeyFormat key_format_;
    std::string key_passphrase_;
};

/**
 * HTTP CONNECT proxy used to tunnel every connection.
 * Only Basic authentication is supported.
 */
struct HttpTunnelSettings {
    std::string hostname;
    int port{80};
    std::optional<std::string> basic_auth_user;
    std::optional<std::string> basic_auth_password;

    /**
     * Build from "http://user:pw@host:port/". The scheme picks the
     * default port (http=80, https=443).
     *
     * @throws std::invalid_argument on a malformed URL
     */
    static HttpTunnelSettings from_url(const std::string& proxy_url);

    /**
     * "Proxy-Authorization: Basic <base64(user:password)>", or an empty
     * string when no user was configured.
     */
    std::string proxy_authorization_header() const;
};

} // namespace tlsscan
