/**
 * Entry point for the tlsscan CLI.
 *
 * Responsible only for:
 * - Parsing and validating command-line options
 * - Delegating target resolution to `run_scan`
 */

#include "cli.hpp"
#include "runner.hpp"

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options.proceed)
        return options.exit_code;
    return run_scan(options);
}
