// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_BRIDGE_HPP
#define BRIDGESCOUT_DISCOVERY_BRIDGE_HPP

#include <functional>
#include <string>

namespace bridgescout {
namespace discovery {

/**
 * Bridge - a confirmed, reachable bridge
 *
 * Discovery produces bridges with an empty username. Callers that already
 * paired with a bridge construct one with WithUsername().
 */
class Bridge {
public:
  explicit Bridge(std::string address) : address_(std::move(address)) {}

  static Bridge WithUsername(std::string address, std::string username) {
    Bridge bridge(std::move(address));
    bridge.username_ = std::move(username);
    return bridge;
  }

  const std::string &address() const { return address_; }
  const std::string &username() const { return username_; }
  bool has_username() const { return !username_.empty(); }

  bool operator==(const Bridge &other) const {
    return address_ == other.address_ && username_ == other.username_;
  }
  bool operator!=(const Bridge &other) const { return !(*this == other); }

private:
  std::string address_;
  std::string username_;
};

// Callback receiving one candidate address (IP or IP:port)
using CandidateCallback = std::function<void(const std::string &address)>;

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_BRIDGE_HPP
