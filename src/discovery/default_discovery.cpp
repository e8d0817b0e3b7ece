// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "discovery/default_discovery.hpp"
#include "discovery/candidate_confirmer.hpp"
#include "discovery/cloud_registry_prober.hpp"
#include "util/logging.hpp"

namespace bridgescout {
namespace discovery {

std::unique_ptr<BridgeDiscovery>
CreateBridgeDiscovery(const DiscoveryOptions &options) {
  auto bridge_http = std::make_shared<BeastHttpClient>(options.http);

  std::vector<std::shared_ptr<CandidateSource>> sources;
  if (options.use_ssdp) {
    sources.push_back(std::make_shared<MulticastProber>(options.ssdp));
  }
  if (options.use_registry) {
    BeastHttpClient::Options registry_http = options.http;
    registry_http.accept_self_signed = false;
    sources.push_back(std::make_shared<CloudRegistryProber>(
        std::make_shared<BeastHttpClient>(registry_http),
        options.registry_url));
  }

  std::shared_ptr<CandidateSource> fallback;
  if (options.use_scan) {
    fallback = std::make_shared<SubnetScanner>(options.scan);
  }

  LOG_DISC_DEBUG("discovery configured: ssdp={} registry={} scan={}",
                 options.use_ssdp, options.use_registry, options.use_scan);

  return std::make_unique<BridgeDiscovery>(
      std::move(sources), std::move(fallback),
      std::make_shared<DescriptionConfirmer>(std::move(bridge_http)),
      options.discovery);
}

std::vector<Bridge> DiscoverBridges(bool discover_all_bridges) {
  auto discovery = CreateBridgeDiscovery();
  return discovery->discover(discover_all_bridges ? DiscoveryMode::EXHAUSTIVE
                                                  : DiscoveryMode::FIRST_MATCH);
}

} // namespace discovery
} // namespace bridgescout
