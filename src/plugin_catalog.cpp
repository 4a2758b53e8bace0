#include "plugin_catalog.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace tlsscan;

namespace {

/**
 * Plugin described by a fixed table of options.
 */
class StaticPluginOptions : public PluginOptionProvider {
public:
    StaticPluginOptions(std::string title, std::string description,
                        std::vector<OptionDefinition> options)
        : title_(std::move(title)),
          description_(std::move(description)),
          options_(std::move(options)) {}

    std::string title() const override { return title_; }
    std::string description() const override { return description_; }
    std::vector<OptionDefinition> option_definitions() const override { return options_; }

private:
    std::string title_;
    std::string description_;
    std::vector<OptionDefinition> options_;
};

OptionDefinition flag(const std::string& dest, const std::string& help) {
    return {"--" + dest, dest, OptionKind::Flag, help, "", std::nullopt};
}

OptionDefinition text(const std::string& dest, const std::string& metavar, const std::string& help) {
    return {"--" + dest, dest, OptionKind::Text, help, metavar, std::nullopt};
}

std::shared_ptr<const PluginOptionProvider> plugin(std::string title, std::string description,
                                                   std::vector<OptionDefinition> options) {
    return std::make_shared<const StaticPluginOptions>(std::move(title), std::move(description),
                                                       std::move(options));
}

} // namespace

PluginOptionProviders builtin_plugin_options() {
    PluginOptionProviders plugins;

    plugins.push_back(plugin(
        "OpenSslCipherSuitesPlugin",
        "Scans the server(s) for supported OpenSSL cipher suites.",
        {
            flag("sslv2",   "Lists the SSL 2.0 OpenSSL cipher suites supported by the server(s)."),
            flag("sslv3",   "Lists the SSL 3.0 OpenSSL cipher suites supported by the server(s)."),
            flag("tlsv1",   "Lists the TLS 1.0 OpenSSL cipher suites supported by the server(s)."),
            flag("tlsv1_1", "Lists the TLS 1.1 OpenSSL cipher suites supported by the server(s)."),
            flag("tlsv1_2", "Lists the TLS 1.2 OpenSSL cipher suites supported by the server(s)."),
            flag("http_get", "Option - For each cipher suite, sends an HTTP GET request after "
                             "completing the SSL handshake and returns the HTTP status code."),
            flag("hide_rejected_ciphers", "Option - Hides the (usually long) list of cipher "
                                          "suites that were rejected by the server(s)."),
        }));

    plugins.push_back(plugin(
        "CertificateInfoPlugin",
        "Verifies the validity of the server(s) certificate(s) against various trust stores.",
        {
            flag("certinfo_basic", "Verifies the validity of the server(s) certificate(s) against "
                                   "various trust stores and displays basic certificate information."),
            flag("certinfo_full", "Verifies the validity of the server(s) certificate(s) against "
                                  "various trust stores and displays the full certificate."),
            text("ca_file", "CA_FILE", "Local Certificate Authority file (in PEM format), to verify "
                                       "the validity of the server(s) certificate(s) against."),
        }));

    plugins.push_back(plugin(
        "CompressionPlugin",
        "Tests the server(s) for Zlib compression support.",
        { flag("compression", "Tests the server(s) for Zlib compression support.") }));

    plugins.push_back(plugin(
        "SessionRenegotiationPlugin",
        "Tests the server(s) for client-initiated renegotiation and secure renegotiation support.",
        { flag("reneg", "Tests the server(s) for client-initiated renegotiation and secure "
                        "renegotiation support.") }));

    plugins.push_back(plugin(
        "SessionResumptionPlugin",
        "Analyzes the server(s) SSL session resumption capabilities.",
        {
            flag("resum", "Tests the server(s) for session resumption support using session IDs "
                          "and TLS session tickets."),
            flag("resum_rate", "Performs 100 session resumptions with the server(s), in order to "
                               "estimate the session resumption rate."),
        }));

    plugins.push_back(plugin(
        "HeartbleedPlugin",
        "Tests the server(s) for the OpenSSL Heartbleed vulnerability.",
        { flag("heartbleed", "Tests the server(s) for the OpenSSL Heartbleed vulnerability.") }));

    plugins.push_back(plugin(
        "OpenSslCcsInjectionPlugin",
        "Tests the server(s) for the OpenSSL CCS injection vulnerability.",
        { flag("openssl_ccs", "Tests the server(s) for the OpenSSL CCS injection vulnerability "
                              "(experimental).") }));

    plugins.push_back(plugin(
        "FallbackScsvPlugin",
        "Scans the server(s) to check if they support TLS_FALLBACK_SCSV.",
        { flag("fallback", "Checks support for the TLS_FALLBACK_SCSV cipher suite to prevent "
                           "downgrade attacks.") }));

    plugins.push_back(plugin(
        "HttpHeadersPlugin",
        "Checks for the HTTP Strict Transport Security header.",
        { flag("hsts", "Checks support for HTTP Strict Transport Security (HSTS) by collecting "
                       "any Strict-Transport-Security field present in the HTTP response sent "
                       "back by the server(s).") }));

    return plugins;
}
