// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "discovery/candidate_confirmer.hpp"
#include "discovery/errors.hpp"
#include "discovery/http_client.hpp"
#include "discovery/protocol.hpp"
#include "util/logging.hpp"

namespace bridgescout {
namespace discovery {

bool MatchesBridgeFingerprint(std::string_view description) {
  return description.find(protocol::fingerprint::DEVICE_TYPE) !=
             std::string_view::npos &&
         description.find(protocol::fingerprint::MANUFACTURER) !=
             std::string_view::npos &&
         description.find(protocol::fingerprint::MODEL_URL) !=
             std::string_view::npos;
}

DescriptionConfirmer::DescriptionConfirmer(std::shared_ptr<HttpClient> http)
    : http_(std::move(http)) {}

ConfirmResult DescriptionConfirmer::confirm(const std::string &address,
                                            std::stop_token stop) {
  const std::string url =
      "http://" + address + std::string(protocol::DESCRIPTION_PATH);

  HttpResponse response;
  try {
    response = http_->get(url, stop);
  } catch (const TransportError &e) {
    // An unreachable candidate is simply not a bridge
    LOG_DISC_DEBUG("confirm: {} unreachable: {}", address, e.what());
    return ConfirmResult::REJECTED;
  }

  if (response.status != 200) {
    LOG_DISC_DEBUG("confirm: {} answered HTTP {}", address, response.status);
    return ConfirmResult::REJECTED;
  }
  if (!MatchesBridgeFingerprint(response.body)) {
    LOG_DISC_DEBUG("confirm: {} is not a bridge", address);
    return ConfirmResult::REJECTED;
  }

  LOG_DISC_DEBUG("confirm: {} is a bridge", address);
  return ConfirmResult::CONFIRMED;
}

} // namespace discovery
} // namespace bridgescout
