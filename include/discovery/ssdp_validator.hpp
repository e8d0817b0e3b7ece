// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_SSDP_VALIDATOR_HPP
#define BRIDGESCOUT_DISCOVERY_SSDP_VALIDATOR_HPP

#include <map>
#include <string>
#include <string_view>

namespace bridgescout {
namespace discovery {

struct ValidationResult {
  bool valid = false;
  std::string reason; // empty when valid

  static ValidationResult Ok() { return {true, ""}; }
  static ValidationResult Fail(std::string why) { return {false, std::move(why)}; }

  explicit operator bool() const { return valid; }
};

struct SsdpResponse {
  // Set when the datagram parsed as a conformant HTTP response header
  bool well_formed = false;
  std::string status_line;
  // Header names lower-cased, values trimmed. Later duplicates are ignored.
  std::map<std::string, std::string> headers;

  const std::string *header(const std::string &lower_name) const;
};

// Split a raw SSDP datagram into its status line and headers. Conformant
// replies go through the HTTP response parser. Replies it refuses (bare LF
// line endings, junk header lines) are split line by line instead. Stops
// at the first empty line.
SsdpResponse ParseSsdpHeaders(std::string_view raw);

/**
 * Decide whether an SSDP reply comes from a compatible bridge.
 *
 * All of the following must hold:
 *  1. status line is HTTP/1.x with status 200
 *  2. USN and ST headers are present
 *  3. SERVER header contains the bridge token (case-insensitive)
 *  4. LOCATION header is an http URL whose host equals `origin`
 *
 * Check 4 rejects replies that claim to describe a different host than
 * the one that sent the datagram.
 */
ValidationResult ValidateSsdpResponse(std::string_view raw,
                                      const std::string &origin);

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_SSDP_VALIDATOR_HPP
