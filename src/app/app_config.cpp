// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "app/app_config.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace bridgescout {
namespace app {

namespace {
// Strict unsigned parse: the whole value must be digits within [min, max]
unsigned long ParseNumber(const std::string &option, const std::string &value,
                          unsigned long min, unsigned long max) {
  if (value.empty() ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("invalid value for " + option + ": '" + value +
                                "'");
  }
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("value out of range for " + option);
  }
  if (parsed < min || parsed > max) {
    throw std::invalid_argument(option + " must be between " +
                                std::to_string(min) + " and " +
                                std::to_string(max));
  }
  return parsed;
}

std::vector<std::string> SplitComma(const std::string &list) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= list.length()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) {
      comma = list.length();
    }
    if (comma > pos) {
      items.push_back(list.substr(pos, comma - pos));
    }
    pos = comma + 1;
  }
  return items;
}

bool TakeValue(const std::string &arg, const std::string &prefix,
               std::string &value) {
  if (arg.rfind(prefix, 0) != 0) {
    return false;
  }
  value = arg.substr(prefix.length());
  return true;
}
} // namespace

CommandLine ParseCommandLine(int argc, const char *const argv[]) {
  CommandLine result;
  AppConfig &config = result.config;
  std::string value;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      result.action = CommandAction::HELP;
      return result;
    } else if (arg == "--version") {
      result.action = CommandAction::VERSION;
      return result;
    } else if (arg == "--all") {
      config.mode = discovery::DiscoveryMode::EXHAUSTIVE;
    } else if (arg == "--json") {
      config.json_output = true;
    } else if (arg == "--nossdp") {
      config.discovery.use_ssdp = false;
    } else if (arg == "--noregistry") {
      config.discovery.use_registry = false;
    } else if (arg == "--noscan") {
      config.discovery.use_scan = false;
    } else if (TakeValue(arg, "--registry=", value)) {
      if (value.empty()) {
        throw std::invalid_argument("--registry requires a URL");
      }
      config.discovery.registry_url = value;
    } else if (TakeValue(arg, "--scanport=", value)) {
      config.discovery.scan.port =
          static_cast<uint16_t>(ParseNumber("--scanport", value, 1, 65535));
    } else if (TakeValue(arg, "--scanthreads=", value)) {
      config.discovery.scan.concurrency = ParseNumber("--scanthreads", value, 1, 256);
    } else if (TakeValue(arg, "--http-timeout=", value)) {
      config.discovery.http.timeout = std::chrono::milliseconds(
          ParseNumber("--http-timeout", value, 100, 60000));
    } else if (arg == "--insecure") {
      config.discovery.http.accept_self_signed = true;
    } else if (TakeValue(arg, "--ratelimit=", value)) {
      config.discovery.http.min_request_interval = std::chrono::milliseconds(
          ParseNumber("--ratelimit", value, 0, 60000));
    } else if (arg == "--verbose") {
      config.verbose = true;
      config.log_level = "debug";
    } else if (TakeValue(arg, "--loglevel=", value)) {
      config.log_level = value;
    } else if (TakeValue(arg, "--logfile=", value)) {
      config.log_file = value;
    } else if (TakeValue(arg, "--debug=", value)) {
      // Comma-separated: --debug=discovery,http
      for (auto &component : SplitComma(value)) {
        config.debug_components.push_back(component);
      }
    } else {
      throw std::invalid_argument("unknown option: " + arg);
    }
  }

  if (!config.discovery.use_ssdp && !config.discovery.use_registry &&
      !config.discovery.use_scan) {
    throw std::invalid_argument("all discovery strategies are disabled");
  }
  return result;
}

std::string Usage(const std::string &program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Find compatible bridges on the local network.\n"
      << "\n"
      << "Discovery:\n"
      << "  --all                Wait for every bridge (default: first match)\n"
      << "  --nossdp             Do not send the SSDP multicast search\n"
      << "  --noregistry         Do not query the cloud registry\n"
      << "  --registry=<url>     Cloud registry endpoint\n"
      << "  --noscan             Never fall back to scanning the local subnet\n"
      << "  --scanport=<port>    TCP port probed by the subnet scan (default: 80)\n"
      << "  --scanthreads=<n>    Concurrent connects during the scan (default: 20)\n"
      << "\n"
      << "HTTP:\n"
      << "  --http-timeout=<ms>  Per request timeout (default: 2000)\n"
      << "  --insecure           Accept self-signed bridge certificates\n"
      << "  --ratelimit=<ms>     Minimum delay between bridge requests\n"
      << "\n"
      << "Output and logging:\n"
      << "  --json               Print results as JSON\n"
      << "  --loglevel=<level>   trace,debug,info,warn,error,critical (default: warn)\n"
      << "  --debug=<component>  Trace logging for discovery, http, app or all\n"
      << "                       Can be comma-separated: --debug=discovery,http\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "  --logfile=<path>     Log to a file instead of stderr\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n";
  return out.str();
}

std::string FormatBridges(const std::vector<discovery::Bridge> &bridges,
                          bool json) {
  if (json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &bridge : bridges) {
      nlohmann::json entry;
      entry["address"] = bridge.address();
      if (bridge.has_username()) {
        entry["username"] = bridge.username();
      }
      out.push_back(std::move(entry));
    }
    return out.dump(2) + "\n";
  }

  std::string text;
  for (const auto &bridge : bridges) {
    text += bridge.address() + "\n";
  }
  return text;
}

} // namespace app
} // namespace bridgescout
