/**
 * High-level run logic.
 *
 * Exposes a single entry point used by the CLI frontend. Name resolution
 * and reachability checks are delegated to a tlsscan::ConnectivityProber.
 */

#pragma once
#include <iosfwd>

#include "cli.hpp"
#include "tlsscan/connectivity.hpp"

/**
 * Resolve every target with the socket prober built from the
 * configuration and print the availability report.
 *
 * @return 0 when the batch was resolved (even with failed targets),
 *         1 on a misconfiguration detected while resolving.
 */
int run_scan(const CliOptions& opt);

/**
 * Same, with the prober and output streams supplied by the caller.
 */
int run_scan(const CliOptions& opt, tlsscan::ConnectivityProber& prober,
             std::ostream& out, std::ostream& err);
