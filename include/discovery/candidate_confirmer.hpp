// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_DISCOVERY_CANDIDATE_CONFIRMER_HPP
#define BRIDGESCOUT_DISCOVERY_CANDIDATE_CONFIRMER_HPP

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace bridgescout {
namespace discovery {

class HttpClient;

enum class ConfirmResult {
  CONFIRMED,
  REJECTED
};

/**
 * Confirmer - decides whether a candidate host really is a bridge.
 * Must be callable from several threads at once.
 */
class Confirmer {
public:
  virtual ~Confirmer() = default;

  virtual ConfirmResult confirm(const std::string &address,
                                std::stop_token stop) = 0;
};

// True if the device description carries all three bridge fingerprints
bool MatchesBridgeFingerprint(std::string_view description);

/**
 * DescriptionConfirmer - fetches http://<address>/description.xml and
 * checks the fingerprint. Unreachable hosts, HTTP errors and partial
 * matches are all rejections; nothing is thrown.
 */
class DescriptionConfirmer : public Confirmer {
public:
  explicit DescriptionConfirmer(std::shared_ptr<HttpClient> http);

  ConfirmResult confirm(const std::string &address,
                        std::stop_token stop) override;

private:
  std::shared_ptr<HttpClient> http_;
};

} // namespace discovery
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_CANDIDATE_CONFIRMER_HPP
