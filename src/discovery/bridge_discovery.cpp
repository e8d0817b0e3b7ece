// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "discovery/bridge_discovery.hpp"
#include "discovery/candidate_confirmer.hpp"
#include "discovery/candidate_source.hpp"
#include "discovery/errors.hpp"
#include "util/channel.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace bridgescout {
namespace discovery {

namespace {

using Clock = std::chrono::steady_clock;

// Outstanding work attributed to one source: its probe thread plus the
// confirmations of the candidates it produced.
struct SourceWork {
  std::atomic<size_t> outstanding{0};

  bool busy() const { return outstanding.load() > 0; }
};

/**
 * DiscoveryRun - state of one discover() call
 *
 * Owns the probe threads, the confirmation pool and the result stream.
 * Destruction cancels and joins everything, so nothing outlives the call.
 */
class DiscoveryRun {
public:
  DiscoveryRun(std::shared_ptr<Confirmer> confirmer, size_t parallelism)
      : confirmer_(std::move(confirmer)),
        pool_(std::max<size_t>(1, parallelism)) {}

  ~DiscoveryRun() {
    Cancel();
    for (auto &thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    pool_.Shutdown(true);
  }

  DiscoveryRun(const DiscoveryRun &) = delete;
  DiscoveryRun &operator=(const DiscoveryRun &) = delete;

  // Start `source` on its own thread. Returns null if the run was cancelled.
  std::shared_ptr<SourceWork> Start(const std::shared_ptr<CandidateSource> &source) {
    if (!results_.AddProducer()) {
      return nullptr;
    }
    auto work = std::make_shared<SourceWork>();
    work->outstanding = 1;

    try {
      threads_.emplace_back([this, source, work] {
        RunSource(*source, work);
        work->outstanding.fetch_sub(1);
        results_.ReleaseProducer();
      });
    } catch (const std::system_error &e) {
      LOG_DISC_ERROR("failed to start {} probe: {}", source->name(), e.what());
      work->outstanding = 0;
      results_.ReleaseProducer();
      return nullptr;
    }
    return work;
  }

  util::ChannelStatus Next(Bridge &out, std::chrono::milliseconds timeout) {
    return results_.PopFor(out, timeout);
  }

  void Cancel() {
    stop_.request_stop();
    results_.Close();
  }

  size_t candidates() const {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    return seen_.size();
  }

private:
  void RunSource(CandidateSource &source, const std::shared_ptr<SourceWork> &work) {
    const auto started = Clock::now();
    try {
      source.probe(
          [this, work](const std::string &address) { Submit(address, work); },
          stop_.get_token());
    } catch (const TransportError &e) {
      LOG_DISC_WARN("{} probe failed: {}", source.name(), e.what());
      return;
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("{} probe failed unexpectedly: {}", source.name(), e.what());
      return;
    }
    LOG_DISC_DEBUG("{} probe done after {} ms", source.name(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(
                       Clock::now() - started)
                       .count());
  }

  // Global dedup, then hand the candidate to the confirmation pool
  void Submit(const std::string &address, const std::shared_ptr<SourceWork> &work) {
    {
      std::lock_guard<std::mutex> lock(seen_mutex_);
      if (!seen_.insert(address).second) {
        LOG_DISC_TRACE("candidate {} already seen", address);
        return;
      }
    }
    // The submitting probe holds a lease, so this only fails on cancel
    if (!results_.AddProducer()) {
      return;
    }
    work->outstanding.fetch_add(1);

    try {
      pool_.enqueue([this, address, work] {
        Confirm(address);
        work->outstanding.fetch_sub(1);
        results_.ReleaseProducer();
      });
    } catch (const std::runtime_error &e) {
      LOG_DISC_TRACE("dropping candidate {}: {}", address, e.what());
      work->outstanding.fetch_sub(1);
      results_.ReleaseProducer();
    }
  }

  void Confirm(const std::string &address) {
    if (stop_.stop_requested()) {
      return;
    }
    ConfirmResult result = ConfirmResult::REJECTED;
    try {
      result = confirmer_->confirm(address, stop_.get_token());
    } catch (const std::exception &e) {
      LOG_DISC_WARN("confirming {} failed: {}", address, e.what());
      return;
    }
    if (result == ConfirmResult::CONFIRMED) {
      results_.Push(Bridge(address));
    }
  }

  std::stop_source stop_;
  std::shared_ptr<Confirmer> confirmer_;
  util::Channel<Bridge> results_;

  mutable std::mutex seen_mutex_;
  std::unordered_set<std::string> seen_;

  std::vector<std::thread> threads_;
  util::ThreadPool pool_;
};

} // namespace

const char *DiscoveryModeName(DiscoveryMode mode) {
  switch (mode) {
  case DiscoveryMode::FIRST_MATCH:
    return "first-match";
  case DiscoveryMode::EXHAUSTIVE:
    return "exhaustive";
  }
  return "unknown";
}

const char *DiscoveryStateName(DiscoveryState state) {
  switch (state) {
  case DiscoveryState::SEARCHING:
    return "searching";
  case DiscoveryState::SCAN_ESCALATED:
    return "scan-escalated";
  case DiscoveryState::DONE_SUCCESS:
    return "done-success";
  case DiscoveryState::DONE_FAILURE:
    return "done-failure";
  }
  return "unknown";
}

BridgeDiscovery::BridgeDiscovery(
    std::vector<std::shared_ptr<CandidateSource>> sources,
    std::shared_ptr<CandidateSource> fallback,
    std::shared_ptr<Confirmer> confirmer, const Config &config)
    : sources_(std::move(sources)), fallback_(std::move(fallback)),
      confirmer_(std::move(confirmer)), config_(config) {
  if (!confirmer_) {
    throw std::invalid_argument("BridgeDiscovery requires a confirmer");
  }
}

BridgeDiscovery::~BridgeDiscovery() = default;

std::vector<Bridge> BridgeDiscovery::discover(DiscoveryMode mode,
                                              std::stop_token stop) {
  const auto started = Clock::now();
  std::vector<Bridge> bridges;
  DiscoveryState state = DiscoveryState::SEARCHING;
  bool escalated = false;
  size_t candidates = 0;

  {
    DiscoveryRun run(confirmer_, config_.confirm_parallelism);
    std::stop_callback on_cancel(stop, [&run] { run.Cancel(); });

    LOG_DISC_INFO("discovering bridges ({} mode)", DiscoveryModeName(mode));
    for (const auto &source : sources_) {
      if (source) {
        run.Start(source);
      }
    }

    std::shared_ptr<SourceWork> scan_work;

    // Nothing confirmed: escalate once, afterwards give up
    auto escalate_or_fail = [&]() {
      if (state == DiscoveryState::SEARCHING && fallback_) {
        LOG_DISC_INFO("no bridge found yet, escalating to {}", fallback_->name());
        escalated = true;
        scan_work = run.Start(fallback_);
        state = scan_work ? DiscoveryState::SCAN_ESCALATED
                          : DiscoveryState::DONE_FAILURE;
      } else {
        state = DiscoveryState::DONE_FAILURE;
      }
    };

    while (state == DiscoveryState::SEARCHING ||
           state == DiscoveryState::SCAN_ESCALATED) {
      Bridge bridge{""};
      util::ChannelStatus status = run.Next(bridge, config_.wait_timeout);

      if (stop.stop_requested()) {
        LOG_DISC_DEBUG("discovery cancelled by caller");
        state = bridges.empty() ? DiscoveryState::DONE_FAILURE
                                : DiscoveryState::DONE_SUCCESS;
        break;
      }

      switch (status) {
      case util::ChannelStatus::ITEM:
        if (std::find(bridges.begin(), bridges.end(), bridge) == bridges.end()) {
          LOG_DISC_INFO("found bridge at {}", bridge.address());
          bridges.push_back(std::move(bridge));
        }
        if (mode == DiscoveryMode::FIRST_MATCH) {
          state = DiscoveryState::DONE_SUCCESS;
        }
        break;

      case util::ChannelStatus::TIMEOUT:
        if (!bridges.empty()) {
          state = DiscoveryState::DONE_SUCCESS;
        } else if (state == DiscoveryState::SCAN_ESCALATED && scan_work &&
                   scan_work->busy()) {
          LOG_DISC_TRACE("scan still running, waiting again");
        } else {
          escalate_or_fail();
        }
        break;

      case util::ChannelStatus::CLOSED:
        if (!bridges.empty()) {
          state = DiscoveryState::DONE_SUCCESS;
        } else {
          escalate_or_fail();
        }
        break;
      }
    }

    candidates = run.candidates();
  } // run cancelled and joined here

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - started);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_run_.final_state = state;
    last_run_.escalated = escalated;
    last_run_.candidates = candidates;
    last_run_.bridges = bridges.size();
    last_run_.elapsed = elapsed;
  }

  if (state == DiscoveryState::DONE_FAILURE) {
    LOG_DISC_INFO("bridge discovery failed after {} ms ({} candidates)",
                  elapsed.count(), candidates);
    throw DiscoveryFailed(stop.stop_requested() ? "discovery cancelled"
                                                : "no bridges found");
  }

  LOG_DISC_INFO("discovery finished: {} bridge(s) in {} ms", bridges.size(),
                elapsed.count());
  return bridges;
}

BridgeDiscovery::RunStats BridgeDiscovery::last_run() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return last_run_;
}

} // namespace discovery
} // namespace bridgescout
