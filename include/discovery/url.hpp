// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_URL_HPP
#define BRIDGESCOUT_DISCOVERY_URL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bridgescout {
namespace discovery {

// Absolute http/https URL split into the parts a request needs
struct Url {
  std::string scheme; // lower-case, "http" or "https"
  std::string host;   // without brackets for IPv6 literals
  uint16_t port = 0;  // explicit port or the scheme default
  std::string target; // path + query, at least "/"

  bool is_https() const { return scheme == "https"; }
};

// Returns nullopt for relative URLs, unknown schemes, empty hosts or
// malformed ports. Surrounding whitespace is ignored.
std::optional<Url> ParseUrl(std::string_view text);

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_URL_HPP
