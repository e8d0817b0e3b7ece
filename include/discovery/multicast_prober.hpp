// Copyright (c) 2024 Bridgescout
// SSDP multicast prober

#ifndef BRIDGESCOUT_DISCOVERY_MULTICAST_PROBER_HPP
#define BRIDGESCOUT_DISCOVERY_MULTICAST_PROBER_HPP

#include "discovery/candidate_source.hpp"
#include "discovery/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace bridgescout {
namespace discovery {

/**
 * MulticastProber - sends one M-SEARCH and collects bridge replies
 *
 * The socket is bound to listen_address:listen_port (ephemeral by
 * default, replies are unicast to the sender's port) and receives until
 * `timeout` elapses. Every reply is checked with ValidateSsdpResponse
 * against its source address; each valid source is emitted once per
 * probe() call.
 *
 * Deadline expiry and stop requests end the probe normally. Socket
 * errors throw TransportError.
 */
class MulticastProber : public CandidateSource {
public:
  struct Options {
    std::string target_address; // where the M-SEARCH goes
    uint16_t target_port;
    std::string listen_address;
    uint16_t listen_port; // 0 = ephemeral
    std::chrono::milliseconds timeout;
    int multicast_ttl;

    Options()
        : target_address(protocol::SSDP_MULTICAST_ADDRESS),
          target_port(protocol::SSDP_PORT), listen_address("0.0.0.0"),
          listen_port(0), timeout(protocol::timeouts::SSDP_RECEIVE),
          multicast_ttl(2) {}
  };

  explicit MulticastProber(const Options &options = Options{});

  std::string name() const override { return "ssdp"; }

  void probe(const CandidateCallback &emit, std::stop_token stop) override;

private:
  Options options_;
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_MULTICAST_PROBER_HPP
