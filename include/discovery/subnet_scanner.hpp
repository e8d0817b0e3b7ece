// Copyright (c) 2024 Bridgescout
// Local subnet TCP scanner, the last-resort discovery strategy

#ifndef BRIDGESCOUT_DISCOVERY_SUBNET_SCANNER_HPP
#define BRIDGESCOUT_DISCOVERY_SUBNET_SCANNER_HPP

#include "discovery/candidate_source.hpp"
#include "discovery/protocol.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bridgescout {
namespace discovery {

struct InterfaceAddress {
  std::string name;
  boost::asio::ip::address_v4 address;
  boost::asio::ip::address_v4 netmask;
};

// IPv4 addresses of interfaces that are up and not loopback
std::vector<InterfaceAddress> ListLocalInterfaces();

/**
 * Host addresses of the subnet `self` lives in, excluding the network and
 * broadcast addresses and `self`. Subnets wider than
 * protocol::scan::MIN_PREFIX_LENGTH are narrowed to the /24 around
 * `self`; /31 and /32 yield nothing.
 */
std::vector<boost::asio::ip::address_v4>
EnumerateSubnet(const boost::asio::ip::address_v4 &self,
                const boost::asio::ip::address_v4 &netmask);

/**
 * TCP connect to `port` on every host with at most `concurrency` attempts
 * outstanding, each bounded by `timeout`. Hosts that accept are passed to
 * `emit` as soon as they connect ("ip", or "ip:port" when port != 80).
 * Returns the number of hosts that accepted.
 */
size_t ScanHosts(const std::vector<boost::asio::ip::address_v4> &hosts,
                 uint16_t port, size_t concurrency,
                 std::chrono::milliseconds timeout, const CandidateCallback &emit,
                 std::stop_token stop);

/**
 * SubnetScanner - scans every local IPv4 subnet for hosts accepting TCP
 * connections on the bridge's HTTP port.
 *
 * This costs one connection attempt per subnet host, so the orchestrator
 * only runs it once the network-native strategies came up empty.
 */
class SubnetScanner : public CandidateSource {
public:
  struct Options {
    uint16_t port;
    size_t concurrency;
    std::chrono::milliseconds timeout; // per connect attempt

    Options()
        : port(protocol::scan::DEFAULT_PORT),
          concurrency(protocol::scan::DEFAULT_CONCURRENCY),
          timeout(protocol::timeouts::SCAN_CONNECT) {}
  };

  explicit SubnetScanner(const Options &options = Options{});

  std::string name() const override { return "scan"; }

  // Scan with the configured options
  void probe(const CandidateCallback &emit, std::stop_token stop) override;

  size_t scan(uint16_t port, size_t concurrency,
              std::chrono::milliseconds timeout, const CandidateCallback &emit,
              std::stop_token stop);

private:
  Options options_;
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_SUBNET_SCANNER_HPP
