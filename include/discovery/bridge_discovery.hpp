#pragma once

/*
 BridgeDiscovery - multi-strategy bridge discovery coordinator

 Purpose
 - Run the cheap, network-native strategies (SSDP multicast, cloud
   registry) concurrently
 - Confirm every distinct candidate against the bridge fingerprint with
   bounded parallelism
 - Fall back to the expensive subnet scan exactly once when nothing was
   confirmed in time
 - Return a deduplicated list of bridges or throw DiscoveryFailed

 State machine (one run per discover() call)

   SEARCHING ──bridge──────────────────────────────► DONE_SUCCESS
       │        (FIRST_MATCH: at once; EXHAUSTIVE: once the stream
       │         drains or a wait times out)
       │ drained / timeout, nothing found
       ▼
   SCAN_ESCALATED ──bridge──────────────────────────► DONE_SUCCESS
       │ drained / timeout after the scan finished, nothing found
       ▼
   DONE_FAILURE  (DiscoveryFailed)

 Every wait on the result stream is bounded by Config::wait_timeout. A
 timeout during the escalated phase is only final once the scanner and the
 confirmations it triggered are done; the scan itself is bounded by its
 per-attempt timeout and host count.

 Cancellation
 - The caller's stop token ends the wait early; whatever was confirmed so
   far is returned (DiscoveryFailed if nothing was).
 - Before discover() returns, every probe thread is stopped and joined and
   queued confirmations are discarded, on every exit path.
*/

#include "discovery/bridge.hpp"
#include "discovery/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

namespace bridgescout {
namespace discovery {

class CandidateSource;
class Confirmer;

enum class DiscoveryMode {
  FIRST_MATCH, // return as soon as one bridge is confirmed
  EXHAUSTIVE   // collect every bridge that shows up
};

enum class DiscoveryState {
  SEARCHING,
  SCAN_ESCALATED,
  DONE_SUCCESS,
  DONE_FAILURE
};

const char *DiscoveryModeName(DiscoveryMode mode);
const char *DiscoveryStateName(DiscoveryState state);

class BridgeDiscovery {
public:
  struct Config {
    // Bounded wait on the result stream. Fixed in production; tests shorten it.
    std::chrono::milliseconds wait_timeout;
    // Concurrent candidate confirmations
    size_t confirm_parallelism;

    Config()
        : wait_timeout(protocol::timeouts::DISCOVERY_WAIT),
          confirm_parallelism(4) {}
  };

  // Summary of the most recent discover() call
  struct RunStats {
    DiscoveryState final_state = DiscoveryState::SEARCHING;
    bool escalated = false;
    size_t candidates = 0; // distinct candidate addresses
    size_t bridges = 0;
    std::chrono::milliseconds elapsed{0};
  };

  /**
   * @param sources    strategies started immediately (SSDP, registry)
   * @param fallback   strategy started on escalation (subnet scan), may be
   *                   null to disable escalation
   * @param confirmer  applied to every distinct candidate
   */
  BridgeDiscovery(std::vector<std::shared_ptr<CandidateSource>> sources,
                  std::shared_ptr<CandidateSource> fallback,
                  std::shared_ptr<Confirmer> confirmer,
                  const Config &config = Config{});
  ~BridgeDiscovery();

  BridgeDiscovery(const BridgeDiscovery &) = delete;
  BridgeDiscovery &operator=(const BridgeDiscovery &) = delete;

  /**
   * Run one discovery.
   * @return non-empty list of bridges, in arrival order, no duplicates
   * @throws DiscoveryFailed if no bridge was confirmed
   */
  std::vector<Bridge> discover(DiscoveryMode mode, std::stop_token stop = {});

  RunStats last_run() const;

  const Config &config() const { return config_; }

private:
  std::vector<std::shared_ptr<CandidateSource>> sources_;
  std::shared_ptr<CandidateSource> fallback_;
  std::shared_ptr<Confirmer> confirmer_;
  Config config_;

  mutable std::mutex stats_mutex_;
  RunStats last_run_;
};

} // namespace discovery
} // namespace bridgescout
