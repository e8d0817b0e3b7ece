// Copyright (c) 2024 Bridgescout
// End-to-end discovery over loopback
//
// A real MulticastProber talks to an SsdpResponder on 127.0.0.1; the
// registry and description.xml are served by a FakeHttpClient.

#include <catch2/catch_test_macros.hpp>
#include "discovery/bridge_discovery.hpp"
#include "discovery/candidate_confirmer.hpp"
#include "discovery/cloud_registry_prober.hpp"
#include "discovery/discovery_fakes.hpp"
#include "discovery/errors.hpp"
#include "discovery/loopback_servers.hpp"
#include "discovery/multicast_prober.hpp"
#include <algorithm>
#include <memory>
#include <set>

using namespace bridgescout::discovery;
using namespace bridgescout::test;
using namespace std::chrono_literals;

namespace {
const std::string REGISTRY = "https://registry.test/";
const std::string LOOPBACK_DESCRIPTION = "http://127.0.0.1/description.xml";

std::shared_ptr<MulticastProber> LoopbackProber(const SsdpResponder& responder) {
    MulticastProber::Options options;
    options.target_address = "127.0.0.1";
    options.target_port = responder.port();
    options.listen_address = "127.0.0.1";
    options.timeout = 400ms;
    return std::make_shared<MulticastProber>(options);
}

BridgeDiscovery::Config ShortWait() {
    BridgeDiscovery::Config config;
    config.wait_timeout = 1s;
    return config;
}
} // namespace

TEST_CASE("SSDP reply confirmed through description.xml", "[discovery][e2e][loopback]") {
    SsdpResponder responder({SsdpResponder::BridgeReply("127.0.0.1"),
                             SsdpResponder::BridgeReply("127.0.0.1")});
    auto http = std::make_shared<FakeHttpClient>();
    http->Respond(LOOPBACK_DESCRIPTION, 200, BridgeDescription());
    auto scan = std::make_shared<FakeSource>("scan");

    BridgeDiscovery discovery({LoopbackProber(responder)}, scan,
                              std::make_shared<DescriptionConfirmer>(http), ShortWait());

    auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);

    REQUIRE(bridges.size() == 1);
    CHECK(bridges[0].address() == "127.0.0.1");
    CHECK(scan->probes() == 0);
    CHECK(http->requests() == std::vector<std::string>{LOOPBACK_DESCRIPTION});
}

TEST_CASE("SSDP impostor is rejected and the scan runs once", "[discovery][e2e][loopback]") {
    SsdpResponder responder({SsdpResponder::BridgeReply("127.0.0.1")});
    auto http = std::make_shared<FakeHttpClient>();
    // Answers SSDP like a bridge but describes itself as something else
    http->Respond(LOOPBACK_DESCRIPTION, 200, OtherDeviceDescription());
    auto scan = std::make_shared<FakeSource>("scan");

    BridgeDiscovery discovery({LoopbackProber(responder)}, scan,
                              std::make_shared<DescriptionConfirmer>(http), ShortWait());

    CHECK_THROWS_AS(discovery.discover(DiscoveryMode::FIRST_MATCH), DiscoveryFailed);
    CHECK(scan->probes() == 1);
    CHECK(discovery.last_run().escalated);
}

TEST_CASE("SSDP reply describing another host is discarded", "[discovery][e2e][loopback]") {
    // Sent from 127.0.0.1 but pointing at a different host
    SsdpResponder responder({SsdpResponder::BridgeReply("10.0.0.9")});
    auto http = std::make_shared<FakeHttpClient>();
    http->Respond("http://10.0.0.9/description.xml", 200, BridgeDescription());
    http->Respond(LOOPBACK_DESCRIPTION, 200, BridgeDescription());
    auto scan = std::make_shared<FakeSource>("scan");

    BridgeDiscovery discovery({LoopbackProber(responder)}, scan,
                              std::make_shared<DescriptionConfirmer>(http), ShortWait());

    CHECK_THROWS_AS(discovery.discover(DiscoveryMode::FIRST_MATCH), DiscoveryFailed);
    CHECK(responder.searches() == 1);
    // Nothing reached the confirmer
    CHECK(http->requests().empty());
    CHECK(scan->probes() == 1);
    CHECK(discovery.last_run().candidates == 0);
}

TEST_CASE("SSDP and registry results are merged", "[discovery][e2e][loopback]") {
    SsdpResponder responder({SsdpResponder::BridgeReply("127.0.0.1")});
    auto http = std::make_shared<FakeHttpClient>();
    http->Respond(REGISTRY, 200,
                  R"([{"id":"001788fffe100491","internalipaddress":"127.0.0.1"},
                      {"id":"001788fffe09a206","internalipaddress":"10.255.0.1"},
                      {"id":"001788fffe09a207","internalipaddress":"10.255.0.2"}])");
    http->Respond(LOOPBACK_DESCRIPTION, 200, BridgeDescription());
    http->Respond("http://10.255.0.1/description.xml", 200, BridgeDescription());
    // 10.255.0.2 is listed but unreachable
    auto scan = std::make_shared<FakeSource>("scan");

    auto registry = std::make_shared<CloudRegistryProber>(http, REGISTRY);
    BridgeDiscovery discovery({LoopbackProber(responder), registry}, scan,
                              std::make_shared<DescriptionConfirmer>(http), ShortWait());

    auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);

    REQUIRE(bridges.size() == 2);
    std::set<std::string> addresses;
    for (const auto& bridge : bridges) {
        addresses.insert(bridge.address());
    }
    CHECK(addresses == std::set<std::string>{"127.0.0.1", "10.255.0.1"});
    CHECK(scan->probes() == 0);

    // 127.0.0.1 was reported twice but fetched once
    auto requests = http->requests();
    CHECK(std::count(requests.begin(), requests.end(), LOOPBACK_DESCRIPTION) == 1);
}
