// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_APP_APP_CONFIG_HPP
#define BRIDGESCOUT_APP_APP_CONFIG_HPP

#include "discovery/bridge.hpp"
#include "discovery/bridge_discovery.hpp"
#include "discovery/default_discovery.hpp"
#include <string>
#include <vector>

namespace bridgescout {
namespace app {

struct AppConfig {
  discovery::DiscoveryMode mode = discovery::DiscoveryMode::FIRST_MATCH;
  discovery::DiscoveryOptions discovery;

  bool json_output = false;
  bool verbose = false;

  std::string log_level = "warn";
  std::vector<std::string> debug_components;
  std::string log_file; // empty = console
};

enum class CommandAction {
  RUN,
  HELP,
  VERSION
};

struct CommandLine {
  CommandAction action = CommandAction::RUN;
  AppConfig config;
};

/**
 * Parse bridgescout's command line (argv[0] is skipped).
 * Throws std::invalid_argument on unknown options or bad values.
 */
CommandLine ParseCommandLine(int argc, const char *const argv[]);

std::string Usage(const std::string &program_name);

// One address per line, or a JSON array of {"address": ...} objects
std::string FormatBridges(const std::vector<discovery::Bridge> &bridges,
                          bool json);

} // namespace app
} // namespace bridgescout

#endif // BRIDGESCOUT_APP_APP_CONFIG_HPP
