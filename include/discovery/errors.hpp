// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_ERRORS_HPP
#define BRIDGESCOUT_DISCOVERY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bridgescout {
namespace discovery {

// Socket, resolve, connect, TLS or HTTP decode failure. Recoverable at
// probe level; never aborts a discovery run.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

// No bridge was confirmed after every strategy, including the subnet scan.
class DiscoveryFailed : public std::runtime_error {
public:
  explicit DiscoveryFailed(const std::string &what = "no bridges found")
      : std::runtime_error(what) {}
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_ERRORS_HPP
