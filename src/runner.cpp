/**
 * Runner: resolves the targets of one invocation.
 *
 * This module handles:
 * - Building the socket prober from timeout / retry settings
 * - Resolving the whole batch before anything is scanned
 * - Printing the availability report (unless --quiet)
 * - Turning a mid-batch misconfiguration into an error exit
 */

#include "runner.hpp"
#include "report.hpp"
#include "terminal.hpp"

#include <iostream>

using namespace tlsscan;

int run_scan(const CliOptions& opt, ConnectivityProber& prober,
             std::ostream& out, std::ostream& err)
{
    const ScanConfiguration& config = *opt.resolved.config;

    BatchResolution batch;
    try {
        batch = resolve_all(opt.resolved.targets, config, prober);
    } catch (const CrossTargetMisconfiguration& e) {
        err << e.usage_message() << "\n";
        return 1;
    }

    if (!config.quiet) {
        print_availability(out, batch);
        if (!batch.descriptors.empty())
            print_scan_commands(out, opt.scan_commands);
    }

    return 0;
}

int run_scan(const CliOptions& opt) {
    term::auto_enable();

    const ScanConfiguration& config = *opt.resolved.config;
    SocketConnectivityProber prober(config.timeout_seconds, config.retry_count);

    return run_scan(opt, prober, std::cout, std::cerr);
}
