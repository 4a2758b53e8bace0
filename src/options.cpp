#include "tlsscan/options.hpp"
#include "tlsscan/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <ostream>

namespace tlsscan {

// ============================================================================
// OptionValues
// ============================================================================

bool OptionValues::flag(const std::string& dest) const {
    auto it = values_.find(dest);
    if (it == values_.end()) return false;
    if (const bool* b = std::get_if<bool>(&it->second)) return *b;
    return false;
}

std::optional<std::string> OptionValues::text(const std::string& dest) const {
    auto it = values_.find(dest);
    if (it == values_.end()) return std::nullopt;
    if (const std::string* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

std::optional<int> OptionValues::integer(const std::string& dest) const {
    auto it = values_.find(dest);
    if (it == values_.end()) return std::nullopt;
    if (const int* v = std::get_if<int>(&it->second)) return *v;
    return std::nullopt;
}

bool OptionValues::has(const std::string& dest) const {
    return values_.count(dest) != 0;
}

void OptionValues::set_flag(const std::string& dest, bool value) {
    values_[dest] = value;
}

void OptionValues::set_text(const std::string& dest, std::string value) {
    values_[dest] = std::move(value);
}

void OptionValues::set_integer(const std::string& dest, int value) {
    values_[dest] = value;
}


// ============================================================================
// Value conversion
// ============================================================================

static bool try_parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - s.c_str()) != s.size()) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
}

static void store(OptionValues& values, const OptionDefinition& def, const std::string& raw) {
    switch (def.kind) {
        case OptionKind::Flag:
            values.set_flag(def.dest, raw == "true" || raw == "1");
            break;
        case OptionKind::Text:
            values.set_text(def.dest, raw);
            break;
        case OptionKind::Integer: {
            int v = 0;
            if (!try_parse_int(raw, v)) {
                throw ConfigurationError(ConfigErrorKind::InvalidOptionValue,
                                         "option " + def.name + ": invalid integer value: '" + raw + "'");
            }
            values.set_integer(def.dest, v);
            break;
        }
    }
}


// ============================================================================
// OptionSchema
// ============================================================================

void OptionSchema::index(const OptionDefinition& option) {
    // Same name registered twice: the latest registration wins
    by_name_[option.name] = option;
}

void OptionSchema::add_group(OptionGroup group) {
    for (const auto& opt : group.options) index(opt);
    groups_.push_back(std::move(group));
}

void OptionSchema::add_option(OptionDefinition option) {
    index(option);
    ungrouped_.push_back(std::move(option));
}

bool OptionSchema::has_option(const std::string& name) const {
    return by_name_.count(name) != 0;
}

const OptionDefinition* OptionSchema::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &it->second;
}

OptionValues OptionSchema::defaults() const {
    OptionValues values;
    for (const auto& entry : by_name_) {
        const auto& def = entry.second;
        if (def.default_value) store(values, def, *def.default_value);
    }
    return values;
}

CommandLine OptionSchema::parse(const std::vector<std::string>& args) const {
    CommandLine cl;
    cl.options = defaults();
    bool positional_only = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if (positional_only || a.size() < 2 || a[0] != '-') {
            cl.targets.push_back(a);
            continue;
        }

        if (a == "--") {
            positional_only = true;
        } else if (a == "-h" || a == "--help") {
            cl.help_requested = true;
        } else if (a == "--version") {
            cl.version_requested = true;
        } else {
            std::string name = a;
            std::optional<std::string> inline_value;
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                name = a.substr(0, eq);
                inline_value = a.substr(eq + 1);
            }

            const OptionDefinition* def = find(name);
            if (!def) {
                throw ConfigurationError(ConfigErrorKind::UnknownOption, "no such option: " + name);
            }

            if (def->kind == OptionKind::Flag) {
                if (inline_value) {
                    throw ConfigurationError(ConfigErrorKind::InvalidOptionValue,
                                             name + " option does not take a value");
                }
                cl.options.set_flag(def->dest, true);
                continue;
            }

            if (!inline_value) {
                if (i + 1 >= args.size()) {
                    throw ConfigurationError(ConfigErrorKind::MissingOptionValue,
                                             name + " option requires an argument");
                }
                inline_value = args[++i];
            }
            store(cl.options, *def, *inline_value);
        }
    }

    return cl;
}


// ============================================================================
// Help rendering
// ============================================================================

static std::string option_label(const OptionDefinition& def) {
    if (def.kind == OptionKind::Flag) return def.name;
    std::string metavar = def.metavar;
    if (metavar.empty()) {
        for (char c : def.dest) metavar.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return def.name + "=" + metavar;
}

static void print_option(std::ostream& out, const OptionDefinition& def, const std::string& indent) {
    const std::string label = option_label(def);
    out << indent << std::left << std::setw(24) << label;
    if (label.size() >= 24) out << "\n" << indent << std::string(24, ' ');
    out << def.help << "\n";
}

void OptionSchema::print_help(std::ostream& out, const std::string& program) const {
    out << "Usage: " << program
        << " [options] target1.com target2.com:443 target3.com:443{ip} etc...\n\n"
        << "Options:\n";

    print_option(out, {"--version", "version", OptionKind::Flag,
                       "show program's version number and exit", "", std::nullopt}, "  ");
    print_option(out, {"-h, --help", "help", OptionKind::Flag,
                       "show this help message and exit", "", std::nullopt}, "  ");
    for (const auto& def : ungrouped_) print_option(out, def, "  ");

    for (const auto& group : groups_) {
        out << "\n  " << group.title << ":\n";
        if (!group.description.empty()) out << "    " << group.description << "\n";
        out << "\n";
        for (const auto& def : group.options) print_option(out, def, "    ");
    }
}


// ============================================================================
// Schema construction
// ============================================================================

const std::vector<std::string>& regular_scan_flags() {
    static const std::vector<std::string> flags = {
        "sslv2", "sslv3", "tlsv1", "tlsv1_1", "tlsv1_2", "reneg", "resum",
        "certinfo_basic", "http_get", "hide_rejected_ciphers", "compression",
        "heartbleed", "openssl_ccs", "fallback"
    };
    return flags;
}

static OptionGroup client_certificate_group() {
    OptionGroup g{"Client certificate options", "", {}};
    g.options.push_back({"--cert", "cert", OptionKind::Text,
        "Client certificate chain filename. The certificates must be in PEM format and must be "
        "sorted starting with the subject's client certificate, followed by intermediate CA "
        "certificates if applicable.", "CERT", std::nullopt});
    g.options.push_back({"--key", "key", OptionKind::Text,
        "Client private key filename.", "KEY", std::nullopt});
    g.options.push_back({"--keyform", "keyform", OptionKind::Text,
        "Client private key format. DER or PEM (default).", "KEYFORM", std::string("PEM")});
    g.options.push_back({"--pass", "keypass", OptionKind::Text,
        "Client private key passphrase.", "KEYPASS", std::string("")});
    return g;
}

static OptionGroup input_output_group() {
    OptionGroup g{"Input and output options", "", {}};
    g.options.push_back({"--xml_out", "xml_file", OptionKind::Text,
        "Write the scan results as an XML document to the file XML_FILE. If XML_FILE is set "
        "to \"-\", the XML output will instead be printed to stdout.", "XML_FILE", std::nullopt});
    g.options.push_back({"--json_out", "json_file", OptionKind::Text,
        "Write the scan results as a JSON document to the file JSON_FILE. If JSON_FILE is set "
        "to \"-\", the JSON output will instead be printed to stdout.", "JSON_FILE", std::nullopt});
    g.options.push_back({"--targets_in", "targets_in", OptionKind::Text,
        "Read the list of targets to scan from the file TARGETS_IN. It should contain one "
        "host:port per line.", "TARGETS_IN", std::nullopt});
    g.options.push_back({"--quiet", "quiet", OptionKind::Flag,
        "Do not output anything to stdout; useful when using --xml_out or --json_out.",
        "", std::nullopt});
    return g;
}

static OptionGroup connectivity_group() {
    OptionGroup g{"Connectivity options", "", {}};
    g.options.push_back({"--timeout", "timeout", OptionKind::Integer,
        "Set the timeout value in seconds used for every socket connection made to the target "
        "server(s). Default is " + std::to_string(kDefaultTimeoutSeconds) + "s.",
        "TIMEOUT", std::to_string(kDefaultTimeoutSeconds)});
    g.options.push_back({"--nb_retries", "nb_retries", OptionKind::Integer,
        "Set the number retry attempts for all network connections initiated throughout the "
        "scan. Default is " + std::to_string(kDefaultRetryCount) + " connection attempts.",
        "NB_RETRIES", std::to_string(kDefaultRetryCount)});
    g.options.push_back({"--https_tunnel", "https_tunnel", OptionKind::Text,
        "Tunnel all traffic to the target server(s) through an HTTP CONNECT proxy. "
        "HTTP_TUNNEL should be the proxy's URL: 'http://USER:PW@HOST:PORT/'. For proxies "
        "requiring authentication, only Basic Authentication is supported.",
        "HTTPS_TUNNEL", std::nullopt});
    g.options.push_back({"--starttls", "starttls", OptionKind::Text,
        "Perform a StartTLS handshake when connecting to the target server(s). StartTLS should "
        "be one of: smtp, xmpp, xmpp_server, pop3, ftp, imap, ldap, rdp, postgres, auto. The "
        "'auto' option deduces the protocol from the port number of each target.",
        "STARTTLS", std::nullopt});
    g.options.push_back({"--xmpp_to", "xmpp_to", OptionKind::Text,
        "Optional setting for STARTTLS XMPP. XMPP_TO should be the hostname to be put in the "
        "'to' attribute of the XMPP stream. Default is the server's hostname.",
        "XMPP_TO", std::nullopt});
    g.options.push_back({"--sni", "sni", OptionKind::Text,
        "Use Server Name Indication to specify the hostname to connect to. Will only affect "
        "TLS 1.0+ connections.", "SNI", std::nullopt});
    return g;
}

OptionSchema build_option_schema(const PluginOptionProviders& plugins) {
    OptionSchema schema;

    schema.add_group(client_certificate_group());
    schema.add_group(input_output_group());
    schema.add_group(connectivity_group());

    for (const auto& plugin : plugins) {
        if (!plugin) continue;
        schema.add_group({plugin->title(), plugin->description(), plugin->option_definitions()});
    }

    std::string regular_help = "Regular HTTPS scan; shortcut for";
    for (const auto& f : regular_scan_flags()) regular_help += " --" + f;
    schema.add_option({"--regular", "regular", OptionKind::Flag, regular_help, "", std::nullopt});

    return schema;
}

} // namespace tlsscan
