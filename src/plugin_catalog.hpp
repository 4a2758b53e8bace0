/**
 * Option groups contributed by the bundled scan plugins.
 *
 * The plugins themselves live outside this repository; only their
 * command-line surface is described here so that the schema, --help
 * and --regular know about their flags.
 */

#pragma once
#include "tlsscan/options.hpp"

/**
 * Plugin option groups in the order they appear in --help.
 */
tlsscan::PluginOptionProviders builtin_plugin_options();
