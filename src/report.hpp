#pragma once
#include <iosfwd>
#include <string>
#include <vector>

#include "tlsscan/connectivity.hpp"

/**
 * Print the host availability block: one line per resolved server
 * ("host:port => ip") followed by one line per rejected server string
 * with the reason it was discarded.
 */
void print_availability(std::ostream& out, const tlsscan::BatchResolution& batch);

/**
 * Print the plugin commands that will run against the available servers.
 */
void print_scan_commands(std::ostream& out, const std::vector<std::string>& commands);
