#include "report.hpp"
#include "terminal.hpp"

#include <iomanip>
#include <ostream>

using namespace tlsscan;

// Column width of the server string, like the classic CLI output.
static const int kServerColumn = 40;

static std::string endpoint(const ServerConnectivityDescriptor& d) {
    return d.hostname() + ":" + std::to_string(d.port());
}

void print_availability(std::ostream& out, const BatchResolution& batch) {
    term::section(out, "CHECKING HOST(S) AVAILABILITY");

    for (const auto& d : batch.descriptors) {
        out << "   " << std::left << std::setw(kServerColumn) << endpoint(d)
            << " => " << term::green();

        if (d.http_tunnel()) {
            out << "via proxy " << d.http_tunnel()->hostname << ":" << d.http_tunnel()->port;
        } else {
            out << d.resolved_ip().value_or("?");
        }
        out << term::reset();

        if (d.tls_wrapped_protocol() != TlsWrappedProtocol::PlainTls)
            out << " (" << to_string(d.tls_wrapped_protocol()) << ")";
        out << "\n";
    }

    for (const auto& f : batch.failures) {
        out << "   " << std::left << std::setw(kServerColumn) << f.original_string
            << " => " << term::red() << "WARNING: " << f.error_msg
            << "; discarding corresponding tasks." << term::reset() << "\n";
    }

    out << "\n";
}

void print_scan_commands(std::ostream& out, const std::vector<std::string>& commands) {
    term::section(out, "SCAN COMMANDS");

    if (commands.empty()) {
        out << "   " << term::yellow() << "No scan command selected; only checking availability."
            << term::reset() << "\n\n";
        return;
    }

    for (const auto& c : commands)
        out << "   --" << c << "\n";
    out << "\n";
}
