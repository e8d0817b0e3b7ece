// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_DEFAULT_DISCOVERY_HPP
#define BRIDGESCOUT_DISCOVERY_DEFAULT_DISCOVERY_HPP

#include "discovery/bridge_discovery.hpp"
#include "discovery/http_client.hpp"
#include "discovery/multicast_prober.hpp"
#include "discovery/subnet_scanner.hpp"
#include <memory>
#include <string>
#include <vector>

namespace bridgescout {
namespace discovery {

// Everything a caller can tune when wiring the real strategies together
struct DiscoveryOptions {
  // Used by the confirmer. The registry client shares the timeout and rate
  // limit but always verifies certificates.
  BeastHttpClient::Options http;
  MulticastProber::Options ssdp;
  SubnetScanner::Options scan;
  std::string registry_url = protocol::CLOUD_REGISTRY_URL;
  bool use_ssdp = true;
  bool use_registry = true;
  bool use_scan = true; // escalate to the subnet scan
  BridgeDiscovery::Config discovery;
};

// SSDP + registry as primary sources, subnet scan as fallback,
// description.xml confirmation over Beast HTTP clients.
std::unique_ptr<BridgeDiscovery>
CreateBridgeDiscovery(const DiscoveryOptions &options = DiscoveryOptions{});

/**
 * One-shot discovery with default options.
 * @param discover_all_bridges wait for every bridge instead of the first
 * @throws DiscoveryFailed
 */
std::vector<Bridge> DiscoverBridges(bool discover_all_bridges);

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_DEFAULT_DISCOVERY_HPP
