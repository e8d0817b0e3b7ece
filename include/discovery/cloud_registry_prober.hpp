// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_CLOUD_REGISTRY_PROBER_HPP
#define BRIDGESCOUT_DISCOVERY_CLOUD_REGISTRY_PROBER_HPP

#include "discovery/candidate_source.hpp"
#include "discovery/protocol.hpp"
#include <memory>
#include <string>
#include <vector>

namespace bridgescout {
namespace discovery {

class HttpClient;

struct RegistryEntry {
  std::string id;
  std::string address; // IP, or IP:port for non-standard ports
};

/**
 * Decode the registry document: a JSON array of objects carrying "id" and
 * "internalipaddress" (and optionally "port").
 * Throws TransportError if the document or any entry is malformed.
 */
std::vector<RegistryEntry> ParseRegistryResponse(const std::string &body);

/**
 * CloudRegistryProber - asks the vendor registry which bridges were seen
 * from this network. One GET, all-or-nothing: nothing is emitted unless
 * the whole response decodes.
 */
class CloudRegistryProber : public CandidateSource {
public:
  CloudRegistryProber(std::shared_ptr<HttpClient> http,
                      std::string endpoint = protocol::CLOUD_REGISTRY_URL);

  std::string name() const override { return "registry"; }

  void probe(const CandidateCallback &emit, std::stop_token stop) override;

  const std::string &endpoint() const { return endpoint_; }

private:
  std::shared_ptr<HttpClient> http_;
  std::string endpoint_;
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_CLOUD_REGISTRY_PROBER_HPP
