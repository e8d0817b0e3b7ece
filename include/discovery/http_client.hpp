// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_HTTP_CLIENT_HPP
#define BRIDGESCOUT_DISCOVERY_HTTP_CLIENT_HPP

#include "discovery/protocol.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace bridgescout {
namespace discovery {

struct HttpResponse {
  unsigned status = 0;
  std::string body;
};

/**
 * HttpClient - abstract GET-only HTTP client
 *
 * Allows dependency injection of different implementations:
 * - BeastHttpClient: real HTTP/HTTPS over boost::asio
 * - test doubles serving canned responses
 *
 * get() throws TransportError on resolve, connect, TLS, timeout,
 * cancellation or protocol errors. A non-200 status is not an error.
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string &url, std::stop_token stop) = 0;
};

using ResolvedEndpoints = std::vector<boost::asio::ip::tcp::endpoint>;
using ResolveHandler = std::function<void(const boost::system::error_code &,
                                          ResolvedEndpoints)>;
// Asynchronous name lookup. `done` may be called from any thread.
using ResolveFunction = std::function<void(
    const std::string &host, uint16_t port, ResolveHandler done)>;

/**
 * BeastHttpClient - boost::beast implementation of HttpClient
 *
 * Requests run on an io_context owned by the client and driven by its own
 * IO thread; the calling thread only waits for the outcome. The wait is
 * bounded by Options::timeout and ends as soon as `stop` is requested,
 * whatever step the request is in. An abandoned request is cancelled on
 * the IO thread. A system name lookup cannot be interrupted: it finishes
 * in the background, and destroying the client waits for it.
 */
class BeastHttpClient : public HttpClient {
public:
  struct Options {
    // Deadline for one request: resolve, connect, handshake, write, read
    std::chrono::milliseconds timeout;
    // Skip certificate verification (bridges use self-signed certificates)
    bool accept_self_signed;
    // Minimum spacing between two requests issued by this client, 0 = off
    std::chrono::milliseconds min_request_interval;
    // Responses with larger bodies are rejected
    size_t max_body_size;
    // Name lookup, empty = system resolver
    ResolveFunction resolve;

    Options()
        : timeout(protocol::timeouts::HTTP_REQUEST), accept_self_signed(false),
          min_request_interval(0), max_body_size(1024 * 1024) {}
  };

  explicit BeastHttpClient(const Options &options = Options{});
  ~BeastHttpClient() override;

  BeastHttpClient(const BeastHttpClient &) = delete;
  BeastHttpClient &operator=(const BeastHttpClient &) = delete;

  HttpResponse get(const std::string &url, std::stop_token stop) override;

  const Options &options() const { return options_; }

private:
  // Blocks until this request may go out under the rate limit.
  // Returns false if stop was requested while waiting.
  bool WaitForRequestSlot(std::stop_token stop);

  Options options_;

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  std::mutex rate_mutex_;
  std::chrono::steady_clock::time_point next_slot_{};
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_HTTP_CLIENT_HPP
