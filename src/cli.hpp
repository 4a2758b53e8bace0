#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "tlsscan/config.hpp"

/**
 * Outcome of command-line processing for the tlsscan executable.
 *
 * When `proceed` is false the program exits immediately with
 * `exit_code` (help, version, or a configuration error that has already
 * been printed).
 */
struct CliOptions {
    bool proceed{false};
    int exit_code{0};

    tlsscan::ResolvedConfiguration resolved;   // Valid only when proceed is true

    std::vector<std::string> scan_commands;    // Enabled plugin flags, schema order
};

/**
 * Parse and validate all command-line arguments.
 * Errors are reported on stderr in the usual two-line format.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Same as above, on an argument vector without the program name, with
 * explicit output streams.
 */
CliOptions parse_args(const std::vector<std::string>& args,
                      std::ostream& out, std::ostream& err);
