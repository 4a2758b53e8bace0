#include "cli.hpp"
#include "plugin_catalog.hpp"
#include "tlsscan/errors.hpp"
#include "tlsscan/options.hpp"

#include <iostream>
#include <string>

#ifndef TLSSCAN_VERSION
#define TLSSCAN_VERSION "0.1.0"
#endif

using namespace tlsscan;

/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * Steps:
 *   - build the option schema (core groups + bundled plugins + --regular)
 *   - split argv into option values and server strings
 *   - validate everything into a ScanConfiguration
 *
 * Any ConfigurationError stops processing: the message is printed and
 * the caller exits with status 1 before touching the network.
 */
CliOptions parse_args(const std::vector<std::string>& args,
                      std::ostream& out, std::ostream& err)
{
    CliOptions opt{};

    const PluginOptionProviders plugins = builtin_plugin_options();
    const OptionSchema schema = build_option_schema(plugins);

    try {
        CommandLine cl = schema.parse(args);

        if (cl.help_requested) {
            schema.print_help(out, "tlsscan");
            return opt;
        }
        if (cl.version_requested) {
            out << TLSSCAN_VERSION << "\n";
            return opt;
        }

        opt.resolved = resolve_configuration(std::move(cl.options), std::move(cl.targets));
    } catch (const ConfigurationError& e) {
        err << e.usage_message() << "\n";
        opt.exit_code = 1;
        return opt;
    }

    // Plugin flags that ended up enabled (--regular already expanded)
    for (const auto& plugin : plugins) {
        for (const auto& def : plugin->option_definitions()) {
            if (def.kind == OptionKind::Flag && opt.resolved.options.flag(def.dest))
                opt.scan_commands.push_back(def.dest);
        }
    }

    opt.proceed = true;
    return opt;
}

CliOptions parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args, std::cout, std::cerr);
}
