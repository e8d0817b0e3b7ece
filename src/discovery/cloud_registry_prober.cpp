// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "discovery/cloud_registry_prober.hpp"
#include "discovery/errors.hpp"
#include "discovery/http_client.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace bridgescout {
namespace discovery {

std::vector<RegistryEntry> ParseRegistryResponse(const std::string &body) {
  using json = nlohmann::json;

  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error &e) {
    throw TransportError(std::string("registry response is not JSON: ") +
                         e.what());
  }

  if (!root.is_array()) {
    throw TransportError("registry response is not a JSON array");
  }

  std::vector<RegistryEntry> entries;
  entries.reserve(root.size());
  for (const auto &item : root) {
    if (!item.is_object()) {
      throw TransportError("registry entry is not an object");
    }
    auto ip = item.find("internalipaddress");
    if (ip == item.end() || !ip->is_string() ||
        ip->get<std::string>().empty()) {
      throw TransportError("registry entry without internalipaddress");
    }

    RegistryEntry entry;
    entry.address = ip->get<std::string>();
    auto id = item.find("id");
    if (id != item.end() && id->is_string()) {
      entry.id = id->get<std::string>();
    }
    auto port = item.find("port");
    if (port != item.end() && port->is_number_unsigned()) {
      auto value = port->get<uint32_t>();
      // 443 is the bridge's HTTPS API; description.xml is always on 80
      if (value != 0 && value != 80 && value != 443 && value <= 65535) {
        entry.address += ":" + std::to_string(value);
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

CloudRegistryProber::CloudRegistryProber(std::shared_ptr<HttpClient> http,
                                         std::string endpoint)
    : http_(std::move(http)), endpoint_(std::move(endpoint)) {}

void CloudRegistryProber::probe(const CandidateCallback &emit,
                                std::stop_token stop) {
  HttpResponse response = http_->get(endpoint_, stop);
  if (response.status != 200) {
    throw TransportError("registry " + endpoint_ + " returned HTTP " +
                         std::to_string(response.status));
  }

  auto entries = ParseRegistryResponse(response.body);
  LOG_DISC_DEBUG("registry: {} bridge(s) listed", entries.size());

  for (const auto &entry : entries) {
    if (stop.stop_requested()) {
      return;
    }
    LOG_DISC_TRACE("registry: bridge {} at {}", entry.id, entry.address);
    emit(entry.address);
  }
}

} // namespace discovery
} // namespace bridgescout
