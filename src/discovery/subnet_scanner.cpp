// Copyright (c) 2024 Bridgescout
// Local subnet TCP scanner implementation

#include "discovery/subnet_scanner.hpp"
#include "discovery/errors.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cerrno>
#include <cstring>
#include <functional>
#include <ifaddrs.h>
#include <memory>
#include <net/if.h>
#include <netinet/in.h>
#include <set>

namespace bridgescout {
namespace discovery {

namespace net = boost::asio;
using tcp = net::ip::tcp;
using address_v4 = net::ip::address_v4;

std::vector<InterfaceAddress> ListLocalInterfaces() {
  struct ifaddrs *list = nullptr;
  if (getifaddrs(&list) != 0) {
    throw TransportError(std::string("getifaddrs failed: ") +
                         std::strerror(errno));
  }
  // Released on every exit path
  std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(list,
                                                               &freeifaddrs);

  std::vector<InterfaceAddress> result;
  for (struct ifaddrs *ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || !ifa->ifa_netmask ||
        ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }

    const auto *addr = reinterpret_cast<const sockaddr_in *>(ifa->ifa_addr);
    const auto *mask = reinterpret_cast<const sockaddr_in *>(ifa->ifa_netmask);

    InterfaceAddress entry;
    entry.name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.address = address_v4(ntohl(addr->sin_addr.s_addr));
    entry.netmask = address_v4(ntohl(mask->sin_addr.s_addr));
    result.push_back(std::move(entry));
  }
  return result;
}

std::vector<address_v4> EnumerateSubnet(const address_v4 &self,
                                        const address_v4 &netmask) {
  uint32_t mask = netmask.to_uint();
  int prefix = 0;
  for (uint32_t m = mask; m & 0x80000000u; m <<= 1) {
    ++prefix;
  }
  if (prefix < protocol::scan::MIN_PREFIX_LENGTH) {
    mask = 0xFFFFFF00u;
    prefix = 24;
  }
  if (prefix >= 31) {
    return {};
  }

  const uint32_t self_bits = self.to_uint();
  const uint32_t network = self_bits & mask;
  const uint32_t broadcast = network | ~mask;

  std::vector<address_v4> hosts;
  hosts.reserve(broadcast - network - 1);
  for (uint32_t host = network + 1; host < broadcast; ++host) {
    if (host != self_bits) {
      hosts.emplace_back(host);
    }
  }
  return hosts;
}

size_t ScanHosts(const std::vector<address_v4> &hosts, uint16_t port,
                 size_t concurrency, std::chrono::milliseconds timeout,
                 const CandidateCallback &emit, std::stop_token stop) {
  if (hosts.empty() || stop.stop_requested()) {
    return 0;
  }
  concurrency = std::max<size_t>(1, concurrency);

  net::io_context io;
  std::stop_callback on_stop(stop, [&io] { io.stop(); });

  size_t next = 0;
  size_t in_flight = 0;
  size_t found = 0;

  // Keeps at most `concurrency` connects outstanding; each completion
  // launches the next host.
  std::function<void()> launch = [&]() {
    while (in_flight < concurrency && next < hosts.size()) {
      const address_v4 host = hosts[next++];
      ++in_flight;

      auto socket = std::make_shared<tcp::socket>(io);
      auto timer = std::make_shared<net::steady_timer>(io, timeout);
      timer->async_wait([socket](const boost::system::error_code &ec) {
        if (!ec) {
          boost::system::error_code close_ec;
          socket->close(close_ec);
        }
      });

      socket->async_connect(
          tcp::endpoint(host, port),
          [&, socket, timer, host](const boost::system::error_code &ec) {
            timer->cancel();
            --in_flight;
            if (!ec) {
              ++found;
              boost::system::error_code close_ec;
              socket->close(close_ec);
              std::string address = host.to_string();
              if (port != 80) {
                address += ":" + std::to_string(port);
              }
              LOG_DISC_DEBUG("scan: {} accepts connections", address);
              emit(address);
            }
            launch();
          });
    }
  };
  launch();

  io.run();
  return found;
}

SubnetScanner::SubnetScanner(const Options &options) : options_(options) {}

void SubnetScanner::probe(const CandidateCallback &emit, std::stop_token stop) {
  scan(options_.port, options_.concurrency, options_.timeout, emit, stop);
}

size_t SubnetScanner::scan(uint16_t port, size_t concurrency,
                           std::chrono::milliseconds timeout,
                           const CandidateCallback &emit,
                           std::stop_token stop) {
  std::vector<address_v4> hosts;
  std::set<uint32_t> unique;
  for (const auto &iface : ListLocalInterfaces()) {
    auto subnet = EnumerateSubnet(iface.address, iface.netmask);
    LOG_DISC_DEBUG("scan: {} ({}/{}) contributes {} hosts", iface.name,
                   iface.address.to_string(), iface.netmask.to_string(),
                   subnet.size());
    for (const auto &host : subnet) {
      if (unique.insert(host.to_uint()).second) {
        hosts.push_back(host);
      }
    }
  }

  if (hosts.empty()) {
    LOG_DISC_DEBUG("scan: no scannable IPv4 subnets");
    return 0;
  }

  LOG_DISC_INFO("scanning {} hosts on port {} ({} concurrent)", hosts.size(),
                port, concurrency);
  size_t found = ScanHosts(hosts, port, concurrency, timeout, emit, stop);
  LOG_DISC_DEBUG("scan: finished, {} host(s) answered", found);
  return found;
}

} // namespace discovery
} // namespace bridgescout
