// Copyright (c) 2024 Bridgescout
// SSDP multicast prober implementation

#include "discovery/multicast_prober.hpp"
#include "discovery/errors.hpp"
#include "discovery/ssdp_validator.hpp"
#include "util/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bridgescout {
namespace discovery {

namespace net = boost::asio;
using udp = net::ip::udp;

namespace {
net::ip::address ParseAddress(const std::string &text, const char *what) {
  boost::system::error_code ec;
  auto address = net::ip::make_address(text, ec);
  if (ec) {
    throw TransportError(std::string("invalid ") + what + " address '" + text +
                         "': " + ec.message());
  }
  return address;
}
} // namespace

MulticastProber::MulticastProber(const Options &options) : options_(options) {}

void MulticastProber::probe(const CandidateCallback &emit, std::stop_token stop) {
  const auto listen_address = ParseAddress(options_.listen_address, "listen");
  const auto target_address = ParseAddress(options_.target_address, "target");
  const udp::endpoint target(target_address, options_.target_port);

  net::io_context io;
  udp::socket socket(io);
  boost::system::error_code ec;

  socket.open(listen_address.is_v6() ? udp::v6() : udp::v4(), ec);
  if (ec) {
    throw TransportError("failed to open UDP socket: " + ec.message());
  }

  // Best-effort options
  boost::system::error_code opt_ec;
  socket.set_option(net::socket_base::reuse_address(true), opt_ec);
  if (target_address.is_multicast()) {
    socket.set_option(net::ip::multicast::hops(options_.multicast_ttl), opt_ec);
  }

  socket.bind(udp::endpoint(listen_address, options_.listen_port), ec);
  if (ec) {
    throw TransportError("failed to bind UDP socket to " +
                         options_.listen_address + ":" +
                         std::to_string(options_.listen_port) + ": " +
                         ec.message());
  }

  const std::string_view request(protocol::SSDP_SEARCH_REQUEST);
  socket.send_to(net::buffer(request.data(), request.size()), target, 0, ec);
  if (ec) {
    throw TransportError("failed to send M-SEARCH to " +
                         target.address().to_string() + ": " + ec.message());
  }
  LOG_DISC_DEBUG("ssdp: M-SEARCH sent to {}:{}, listening on port {} for {} ms",
                 target.address().to_string(), target.port(),
                 socket.local_endpoint(opt_ec).port(), options_.timeout.count());

  // The deadline is mandatory: a silent network would otherwise block
  // the receive forever.
  net::steady_timer deadline(io);
  deadline.expires_after(options_.timeout);
  deadline.async_wait([&socket](const boost::system::error_code &timer_ec) {
    if (!timer_ec) {
      boost::system::error_code cancel_ec;
      socket.cancel(cancel_ec);
    }
  });

  std::stop_callback on_stop(stop, [&io] { io.stop(); });

  std::vector<char> buffer(protocol::SSDP_MAX_DATAGRAM);
  udp::endpoint sender;
  std::unordered_set<std::string> seen;
  boost::system::error_code receive_error;
  size_t datagrams = 0;

  std::function<void()> receive = [&]() {
    socket.async_receive_from(
        net::buffer(buffer), sender,
        [&](const boost::system::error_code &recv_ec, size_t length) {
          if (recv_ec == net::error::operation_aborted) {
            return; // deadline
          }
          if (recv_ec == net::error::connection_refused) {
            // ICMP port unreachable from a unicast target, keep listening
            LOG_DISC_TRACE("ssdp: target {} refused the search",
                           target.address().to_string());
            receive();
            return;
          }
          if (recv_ec) {
            receive_error = recv_ec;
            deadline.cancel();
            return;
          }

          ++datagrams;
          const std::string origin = sender.address().to_string();
          auto result = ValidateSsdpResponse(
              std::string_view(buffer.data(), length), origin);
          if (!result) {
            LOG_DISC_TRACE("ssdp: ignoring reply from {}: {}", origin,
                           result.reason);
          } else if (seen.insert(origin).second) {
            LOG_DISC_DEBUG("ssdp: bridge reply from {}", origin);
            emit(origin);
          }
          receive();
        });
  };
  receive();

  io.run();

  socket.close(opt_ec);

  if (receive_error) {
    throw TransportError("SSDP receive failed: " + receive_error.message());
  }
  LOG_DISC_DEBUG("ssdp: probe finished ({} datagrams, {} bridges){}", datagrams,
                 seen.size(), stop.stop_requested() ? " [cancelled]" : "");
}

} // namespace discovery
} // namespace bridgescout
