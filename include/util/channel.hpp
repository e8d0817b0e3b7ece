// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_UTIL_CHANNEL_HPP
#define BRIDGESCOUT_UTIL_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace bridgescout {
namespace util {

enum class ChannelStatus {
  ITEM,    // An item was popped
  TIMEOUT, // The wait elapsed with nothing to pop
  CLOSED   // Drained (no producers, nothing queued) or cancelled
};

/**
 * Channel - multi-producer queue with a bounded-wait consumer side
 *
 * Producers register with AddProducer() before pushing and call
 * ReleaseProducer() when they are finished. Once every producer has
 * released and the queue is empty the channel reports CLOSED.
 * Registering a new producer on a drained channel makes it live again,
 * which is how a second wave of producers joins the same stream.
 *
 * Close() cancels the channel for good: waiters wake up, queued items
 * are discarded and further pushes or registrations fail.
 */
template <typename T>
class Channel {
public:
  Channel() = default;
  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  // Returns false if the channel was cancelled
  bool AddProducer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return false;
    }
    ++producers_;
    return true;
  }

  void ReleaseProducer() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (producers_ > 0) {
        --producers_;
      }
      if (producers_ != 0) {
        return;
      }
    }
    cv_.notify_all();
  }

  // Returns false if the channel was cancelled
  bool Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
      items_.clear();
    }
    cv_.notify_all();
  }

  /**
   * Wait up to `timeout` for an item.
   * Items queued before the last producer released are still delivered
   * before CLOSED is reported.
   */
  template <typename Rep, typename Period>
  ChannelStatus PopFor(T &out, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, timeout, [this] {
      return cancelled_ || !items_.empty() || producers_ == 0;
    });
    if (cancelled_) {
      return ChannelStatus::CLOSED;
    }
    if (!items_.empty()) {
      out = std::move(items_.front());
      items_.pop_front();
      return ChannelStatus::ITEM;
    }
    return ready ? ChannelStatus::CLOSED : ChannelStatus::TIMEOUT;
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  size_t Producers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producers_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  size_t producers_ = 0;
  bool cancelled_ = false;
};

} // namespace util
} // namespace bridgescout

#endif // BRIDGESCOUT_UTIL_CHANNEL_HPP
