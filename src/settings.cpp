#include "tlsscan/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

namespace tlsscan {

// ============================================================================
// TLS wrapped protocols
// ============================================================================

const char* to_string(TlsWrappedProtocol protocol) {
    switch (protocol) {
        case TlsWrappedProtocol::PlainTls:           return "PLAIN_TLS";
        case TlsWrappedProtocol::Https:              return "HTTPS";
        case TlsWrappedProtocol::StartTlsSmtp:       return "STARTTLS_SMTP";
        case TlsWrappedProtocol::StartTlsXmpp:       return "STARTTLS_XMPP";
        case TlsWrappedProtocol::StartTlsXmppServer: return "STARTTLS_XMPP_SERVER";
        case TlsWrappedProtocol::StartTlsPop3:       return "STARTTLS_POP3";
        case TlsWrappedProtocol::StartTlsImap:       return "STARTTLS_IMAP";
        case TlsWrappedProtocol::StartTlsFtp:        return "STARTTLS_FTP";
        case TlsWrappedProtocol::StartTlsLdap:       return "STARTTLS_LDAP";
        case TlsWrappedProtocol::StartTlsRdp:        return "STARTTLS_RDP";
        case TlsWrappedProtocol::StartTlsPostgres:   return "STARTTLS_POSTGRES";
    }
    return "UNKNOWN";
}

int default_port(TlsWrappedProtocol protocol) {
    switch (protocol) {
        case TlsWrappedProtocol::PlainTls:           return 443;
        case TlsWrappedProtocol::Https:              return 443;
        case TlsWrappedProtocol::StartTlsSmtp:       return 25;
        case TlsWrappedProtocol::StartTlsXmpp:       return 5222;
        case TlsWrappedProtocol::StartTlsXmppServer: return 5269;
        case TlsWrappedProtocol::StartTlsPop3:       return 110;
        case TlsWrappedProtocol::StartTlsImap:       return 143;
        case TlsWrappedProtocol::StartTlsFtp:        return 21;
        case TlsWrappedProtocol::StartTlsLdap:       return 389;
        case TlsWrappedProtocol::StartTlsRdp:        return 3389;
        case TlsWrappedProtocol::StartTlsPostgres:   return 5432;
    }
    return 443;
}

bool is_xmpp(TlsWrappedProtocol protocol) {
    return protocol == TlsWrappedProtocol::StartTlsXmpp ||
           protocol == TlsWrappedProtocol::StartTlsXmppServer;
}


// ============================================================================
// OpenSSL helpers
// ============================================================================

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const { if (ctx) SSL_CTX_free(ctx); }
};
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

// Drain the thread's OpenSSL error queue into one line.
static std::string last_openssl_error() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

// Supplies the configured passphrase; never falls back to a tty prompt.
static int passphrase_cb(char* buf, int size, int /*rwflag*/, void* userdata) {
    const auto* pass = static_cast<const std::string*>(userdata);
    if (!pass || size <= 0) return 0;
    const int len = static_cast<int>(std::min<std::size_t>(pass->size(), static_cast<std::size_t>(size)));
    std::memcpy(buf, pass->data(), static_cast<std::size_t>(len));
    return len;
}

static bool is_readable_file(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    return static_cast<bool>(f);
}


// ============================================================================
// Client authentication
// ============================================================================

ClientAuthCredentials::ClientAuthCredentials(std::string certificate_chain_path,
                                             std::string private_key_path,
                                             KeyFormat key_format,
                                             std::string key_passphrase)
    : cert_path_(std::move(certificate_chain_path)),
      key_path_(std::move(private_key_path)),
      key_format_(key_format),
      key_passphrase_(std::move(key_passphrase))
{
    if (!is_readable_file(cert_path_))
        throw std::invalid_argument("Could not open the client certificate file");

    if (!is_readable_file(key_path_))
        throw std::invalid_argument("Could not open the client private key file");

    ERR_clear_error();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
        throw std::invalid_argument("Could not create an OpenSSL context: " + last_openssl_error());

    SSL_CTX_set_default_passwd_cb(ctx.get(), passphrase_cb);
    SSL_CTX_set_default_passwd_cb_userdata(ctx.get(), &key_passphrase_);

    if (SSL_CTX_use_certificate_chain_file(ctx.get(), cert_path_.c_str()) != 1) {
        throw std::invalid_argument("Could not load the client certificate chain ("
                                    + last_openssl_error() + ")");
    }

    const int file_type = key_format_ == KeyFormat::DER ? SSL_FILETYPE_ASN1 : SSL_FILETYPE_PEM;
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), key_path_.c_str(), file_type) != 1) {
        throw std::invalid_argument("Could not load the client private key; "
                                    "check the passphrase and --keyform ("
                                    + last_openssl_error() + ")");
    }

    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        throw std::invalid_argument("The client private key does not match the certificate ("
                                    + last_openssl_error() + ")");
    }
}


// ============================================================================
// HTTP CONNECT tunnel
// ============================================================================

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

HttpTunnelSettings HttpTunnelSettings::from_url(const std::string& proxy_url) {
    // Scheme
    std::string scheme;
    std::string rest = proxy_url;
    const auto colon = proxy_url.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(proxy_url[0])) &&
        std::all_of(proxy_url.begin(), proxy_url.begin() + static_cast<std::string::difference_type>(colon), is_scheme_char))
    {
        scheme = to_lower(proxy_url.substr(0, colon));
        rest = proxy_url.substr(colon + 1);
    }

    // Network location: "//user:pw@host:port" up to the path
    std::string netloc;
    if (rest.compare(0, 2, "//") == 0) {
        const auto end = rest.find_first_of("/?#", 2);
        netloc = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
    }

    std::string userinfo;
    std::string hostinfo = netloc;
    const auto at = netloc.rfind('@');
    if (at != std::string::npos) {
        userinfo = netloc.substr(0, at);
        hostinfo = netloc.substr(at + 1);
    }

    std::string host;
    std::string port_field;
    bool has_port = false;
    if (!hostinfo.empty() && hostinfo[0] == '[') {
        const auto close = hostinfo.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("Invalid Proxy URL");
        host = hostinfo.substr(1, close - 1);
        const auto tail = hostinfo.substr(close + 1);
        if (!tail.empty() && tail[0] == ':') {
            has_port = true;
            port_field = tail.substr(1);
        }
    } else {
        const auto pcolon = hostinfo.find(':');
        host = hostinfo.substr(0, pcolon);
        if (pcolon != std::string::npos) {
            has_port = true;
            port_field = hostinfo.substr(pcolon + 1);
        }
    }

    if (netloc.empty() || host.empty())
        throw std::invalid_argument("Invalid Proxy URL");

    int port = 0;
    if (scheme == "http") {
        port = 80;
    } else if (scheme == "https") {
        port = 443;
    } else {
        throw std::invalid_argument("Invalid URL scheme");
    }

    if (has_port && !port_field.empty()) {
        if (!std::all_of(port_field.begin(), port_field.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }) ||
            port_field.size() > 5)
        {
            throw std::invalid_argument("Port could not be cast to integer value");
        }
        const int explicit_port = std::stoi(port_field);
        if (explicit_port > 65535)
            throw std::invalid_argument("Port out of range 0-65535");
        if (explicit_port > 0)
            port = explicit_port;
    }

    HttpTunnelSettings settings;
    settings.hostname = to_lower(host);
    settings.port = port;
    if (at != std::string::npos) {
        const auto ucolon = userinfo.find(':');
        settings.basic_auth_user = userinfo.substr(0, ucolon);
        if (ucolon != std::string::npos)
            settings.basic_auth_password = userinfo.substr(ucolon + 1);
    }
    return settings;
}

std::string HttpTunnelSettings::proxy_authorization_header() const {
    if (!basic_auth_user)
        return "";

    const std::string credentials = *basic_auth_user + ":" + basic_auth_password.value_or("");

    // 4 output bytes per 3 input bytes, plus the terminating NUL
    std::vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(encoded.data(),
                                  reinterpret_cast<const unsigned char*>(credentials.data()),
                                  static_cast<int>(credentials.size()));

    return "Proxy-Authorization: Basic " +
           std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(n));
}

} // namespace tlsscan
