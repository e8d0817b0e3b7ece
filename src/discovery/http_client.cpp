// Copyright (c) 2024 Bridgescout
// HTTP/HTTPS client using boost::beast on the client's IO thread

#include "discovery/http_client.hpp"
#include "discovery/errors.hpp"
#include "discovery/url.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <condition_variable>
#include <memory>
#include <optional>
#include <type_traits>

namespace bridgescout {
namespace discovery {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;
using Strand = net::strand<net::io_context::executor_type>;

template <class Stream>
constexpr bool IS_TLS = !std::is_same_v<Stream, beast::tcp_stream>;

/**
 * One GET request/response exchange.
 *
 * Handlers run on the client's IO thread, serialized by `strand_`. The
 * caller blocks in Wait(); if it gives up, the exchange is cancelled on the
 * strand and kept alive by its pending handlers until they drain.
 */
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
  Exchange(net::io_context &io, const Url &url, Clock::time_point deadline,
           const BeastHttpClient::Options &options)
      : strand_(net::make_strand(io)), url_(url), deadline_(deadline),
        resolve_(options.resolve), resolver_(strand_) {
    request_.method(http::verb::get);
    request_.target(url_.target);
    request_.version(11);
    bool default_port = (url_.is_https() && url_.port == 443) ||
                        (!url_.is_https() && url_.port == 80);
    std::string host = url_.host.find(':') != std::string::npos
                           ? "[" + url_.host + "]"
                           : url_.host;
    request_.set(http::field::host,
                 default_port ? host : host + ":" + std::to_string(url_.port));
    request_.set(http::field::user_agent, GetUserAgent());
    request_.set(http::field::connection, "close");
    parser_.body_limit(options.max_body_size);

    if constexpr (IS_TLS<Stream>) {
      ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
      if (options.accept_self_signed) {
        ssl_ctx_->set_verify_mode(ssl::verify_none);
      } else {
        ssl_ctx_->set_default_verify_paths();
        ssl_ctx_->set_verify_mode(ssl::verify_peer);
      }
      stream_.emplace(strand_, *ssl_ctx_);
      if (!options.accept_self_signed) {
        stream_->set_verify_callback(ssl::host_name_verification(url_.host));
      }
      // SNI
      if (!SSL_set_tlsext_host_name(stream_->native_handle(),
                                    url_.host.c_str())) {
        throw TransportError("failed to set SNI host name for " + url_.host);
      }
    } else {
      stream_.emplace(strand_);
    }
  }

  void Start() {
    net::post(strand_, [self = this->shared_from_this()] { self->Resolve(); });
  }

  // Blocks until the exchange completes, the deadline passes or `stop` is
  // requested. Throws TransportError unless a response was read.
  HttpResponse Wait(std::stop_token stop, const std::string &url_text) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!done_cv_.wait_until(lock, stop, deadline_, [this] { return done_; })) {
      const std::string step = step_;
      lock.unlock();
      net::post(strand_, [self = this->shared_from_this()] { self->Cancel(); });
      if (stop.stop_requested()) {
        throw TransportError("request to " + url_text + " cancelled");
      }
      throw TransportError(step + " timed out for " + url_text);
    }
    if (error_) {
      throw TransportError(std::string(step_) + " failed for " + url_text +
                           ": " + error_.message());
    }
    return std::move(response_);
  }

private:
  void Resolve() {
    if (cancelled_) {
      return;
    }
    auto self = this->shared_from_this();
    if (resolve_) {
      resolve_(url_.host, url_.port,
               [self](const boost::system::error_code &ec,
                      ResolvedEndpoints endpoints) {
                 net::post(self->strand_, [self, ec,
                                           endpoints = std::move(endpoints)]() mutable {
                   self->OnResolve(ec, std::move(endpoints));
                 });
               });
      return;
    }
    resolver_.async_resolve(
        url_.host, std::to_string(url_.port),
        [self](const boost::system::error_code &ec,
               tcp::resolver::results_type results) {
          ResolvedEndpoints endpoints;
          for (const auto &entry : results) {
            endpoints.push_back(entry.endpoint());
          }
          self->OnResolve(ec, std::move(endpoints));
        });
  }

  void OnResolve(const boost::system::error_code &ec,
                 ResolvedEndpoints endpoints) {
    if (cancelled_) {
      return;
    }
    if (ec) {
      return Finish(ec, "resolve");
    }
    if (endpoints.empty()) {
      return Finish(net::error::host_not_found, "resolve");
    }
    endpoints_ = std::move(endpoints);
    SetStep("connect");

    auto &lowest = beast::get_lowest_layer(*stream_);
    lowest.expires_at(deadline_);
    lowest.async_connect(endpoints_,
                         [self = this->shared_from_this()](
                             const boost::system::error_code &ec,
                             const tcp::endpoint &) {
                           if (ec) {
                             return self->Finish(ec, "connect");
                           }
                           self->OnConnect();
                         });
  }

  void OnConnect() {
    if constexpr (IS_TLS<Stream>) {
      SetStep("handshake");
      beast::get_lowest_layer(*stream_).expires_at(deadline_);
      stream_->async_handshake(
          ssl::stream_base::client,
          [self = this->shared_from_this()](const boost::system::error_code &ec) {
            if (ec) {
              return self->Finish(ec, "handshake");
            }
            self->Write();
          });
    } else {
      Write();
    }
  }

  void Write() {
    SetStep("write");
    beast::get_lowest_layer(*stream_).expires_at(deadline_);
    http::async_write(*stream_, request_,
                      [self = this->shared_from_this()](
                          const boost::system::error_code &ec, size_t) {
                        if (ec) {
                          return self->Finish(ec, "write");
                        }
                        self->Read();
                      });
  }

  void Read() {
    SetStep("read");
    beast::get_lowest_layer(*stream_).expires_at(deadline_);
    http::async_read(*stream_, buffer_, parser_,
                     [self = this->shared_from_this()](
                         const boost::system::error_code &ec, size_t) {
                       if (ec) {
                         return self->Finish(ec, "read");
                       }
                       self->Complete();
                     });
  }

  // Runs on the strand once the caller has given up
  void Cancel() {
    cancelled_ = true;
    resolver_.cancel();
    beast::get_lowest_layer(*stream_).close();
  }

  void Complete() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!done_) {
        response_.status = parser_.get().result_int();
        response_.body = std::move(parser_.get().body());
        done_ = true;
      }
    }
    done_cv_.notify_all();
    beast::get_lowest_layer(*stream_).close();
  }

  void Finish(boost::system::error_code ec, const char *step) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (done_) {
        return;
      }
      error_ = ec;
      step_ = step;
      done_ = true;
    }
    done_cv_.notify_all();
  }

  void SetStep(const char *step) {
    std::lock_guard<std::mutex> lock(mutex_);
    step_ = step;
  }

  Strand strand_;
  Url url_;
  Clock::time_point deadline_;
  ResolveFunction resolve_;
  tcp::resolver resolver_;
  ResolvedEndpoints endpoints_;

  std::unique_ptr<ssl::context> ssl_ctx_;
  std::optional<Stream> stream_;

  http::request<http::empty_body> request_;
  http::response_parser<http::string_body> parser_;
  beast::flat_buffer buffer_;
  bool cancelled_ = false; // strand only

  std::mutex mutex_;
  std::condition_variable_any done_cv_;
  bool done_ = false;
  boost::system::error_code error_;
  const char *step_ = "resolve";
  HttpResponse response_;
};

template <class Stream>
HttpResponse RunExchange(net::io_context &io, const Url &url,
                         const std::string &url_text, Clock::time_point deadline,
                         const BeastHttpClient::Options &options,
                         std::stop_token stop) {
  auto exchange = std::make_shared<Exchange<Stream>>(io, url, deadline, options);
  exchange->Start();
  return exchange->Wait(stop, url_text);
}

} // namespace

BeastHttpClient::BeastHttpClient(const Options &options)
    : options_(options),
      work_guard_(std::make_unique<
                  net::executor_work_guard<net::io_context::executor_type>>(
          net::make_work_guard(io_context_))) {
  io_thread_ = std::thread([this]() { io_context_.run(); });
}

BeastHttpClient::~BeastHttpClient() {
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

bool BeastHttpClient::WaitForRequestSlot(std::stop_token stop) {
  if (options_.min_request_interval.count() <= 0) {
    return !stop.stop_requested();
  }

  Clock::time_point slot;
  {
    std::lock_guard<std::mutex> lock(rate_mutex_);
    slot = std::max(Clock::now(), next_slot_);
    next_slot_ = slot + options_.min_request_interval;
  }

  if (slot > Clock::now()) {
    LOG_HTTP_TRACE("rate limit: delaying request by {} ms",
                   std::chrono::duration_cast<std::chrono::milliseconds>(
                       slot - Clock::now())
                       .count());
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;
    std::unique_lock<std::mutex> lock(wait_mutex);
    wait_cv.wait_until(lock, stop, slot, [] { return false; });
  }
  return !stop.stop_requested();
}

HttpResponse BeastHttpClient::get(const std::string &url_text,
                                  std::stop_token stop) {
  auto url = ParseUrl(url_text);
  if (!url) {
    throw TransportError("malformed URL: " + url_text);
  }

  if (!WaitForRequestSlot(stop)) {
    throw TransportError("request to " + url_text + " cancelled");
  }

  LOG_HTTP_TRACE("GET {}", url_text);

  const auto deadline = Clock::now() + options_.timeout;
  HttpResponse response =
      url->is_https()
          ? RunExchange<beast::ssl_stream<beast::tcp_stream>>(
                io_context_, *url, url_text, deadline, options_, stop)
          : RunExchange<beast::tcp_stream>(io_context_, *url, url_text,
                                           deadline, options_, stop);

  LOG_HTTP_TRACE("GET {} -> {} ({} bytes)", url_text, response.status,
                 response.body.size());
  return response;
}

} // namespace discovery
} // namespace bridgescout
