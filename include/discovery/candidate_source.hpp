#ifndef BRIDGESCOUT_DISCOVERY_CANDIDATE_SOURCE_HPP
#define BRIDGESCOUT_DISCOVERY_CANDIDATE_SOURCE_HPP

#include "discovery/bridge.hpp"
#include <stop_token>
#include <string>

namespace bridgescout {
namespace discovery {

/**
 * CandidateSource - one discovery strategy producing candidate addresses
 *
 * Implementations:
 * - MulticastProber: SSDP M-SEARCH on the local network
 * - CloudRegistryProber: vendor registry over HTTPS
 * - SubnetScanner: TCP connect scan of the local subnets
 *
 * probe() blocks until the strategy is exhausted, its own deadline
 * passes or `stop` is requested, calling `emit` for every candidate in
 * the order found. It throws TransportError when the strategy fails as a
 * whole. A source object may be probed again; every call is a fresh run.
 */
class CandidateSource {
public:
  virtual ~CandidateSource() = default;

  // Short name for logging ("ssdp", "registry", "scan")
  virtual std::string name() const = 0;

  virtual void probe(const CandidateCallback &emit, std::stop_token stop) = 0;
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_CANDIDATE_SOURCE_HPP
