// Copyright (c) 2024 Bridgescout
// Tests for discovery/bridge_discovery.cpp
//
// Sources and the confirmer are fakes, so every scenario is driven by a
// script of timed candidates. Waits are shortened through Config.

#include <catch2/catch_test_macros.hpp>
#include "discovery/bridge_discovery.hpp"
#include "discovery/cloud_registry_prober.hpp"
#include "discovery/discovery_fakes.hpp"
#include "discovery/errors.hpp"
#include "discovery/http_client.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>

using namespace bridgescout::discovery;
using namespace bridgescout::test;
using namespace std::chrono_literals;

namespace {
BridgeDiscovery::Config ShortWait(std::chrono::milliseconds wait = 300ms) {
    BridgeDiscovery::Config config;
    config.wait_timeout = wait;
    config.confirm_parallelism = 4;
    return config;
}

std::set<std::string> Addresses(const std::vector<Bridge>& bridges) {
    std::set<std::string> out;
    for (const auto& bridge : bridges) {
        out.insert(bridge.address());
    }
    return out;
}

using Steps = std::vector<FakeSource::Step>;
} // namespace

TEST_CASE("BridgeDiscovery requires a confirmer", "[discovery][orchestrator]") {
    CHECK_THROWS_AS(BridgeDiscovery({}, nullptr, nullptr), std::invalid_argument);
}

TEST_CASE("BridgeDiscovery FIRST_MATCH returns the first confirmed bridge", "[discovery][orchestrator]") {
    auto ssdp = std::make_shared<FakeSource>(
        "ssdp", Steps{{20ms, "10.0.0.1"}, {300ms, "10.0.0.2"}}, 10s);
    auto scan = std::make_shared<FakeSource>("scan", Steps{{0ms, "10.0.0.3"}});
    auto confirmer = std::make_shared<FakeConfirmer>(
        std::set<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"});

    BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(2s));

    auto start = std::chrono::steady_clock::now();
    auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(bridges.size() == 1);
    CHECK(bridges[0].address() == "10.0.0.1");
    CHECK_FALSE(bridges[0].has_username());
    // Returned well before the lingering source or the wait would end
    CHECK(elapsed < 1s);
    // The lingering source was stopped, not waited for
    CHECK(ssdp->stopped_early());
    CHECK(scan->probes() == 0);

    auto stats = discovery.last_run();
    CHECK(stats.final_state == DiscoveryState::DONE_SUCCESS);
    CHECK_FALSE(stats.escalated);
    CHECK(stats.bridges == 1);
}

TEST_CASE("BridgeDiscovery EXHAUSTIVE collects every bridge once", "[discovery][orchestrator]") {
    auto ssdp = std::make_shared<FakeSource>(
        "ssdp", Steps{{10ms, "10.0.0.1"}, {50ms, "10.0.0.2"}});
    auto registry = std::make_shared<FakeSource>(
        "registry", Steps{{20ms, "10.0.0.2"}, {30ms, "10.0.0.9"}, {70ms, "10.0.0.3"}});
    auto scan = std::make_shared<FakeSource>("scan");
    auto confirmer = std::make_shared<FakeConfirmer>(
        std::set<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"}, 20ms);

    BridgeDiscovery discovery({ssdp, registry}, scan, confirmer, ShortWait(2s));
    auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);

    CHECK(bridges.size() == 3);
    CHECK(Addresses(bridges) == std::set<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"});

    // Candidates are deduplicated before confirmation
    CHECK(confirmer->calls("10.0.0.2") == 1);
    CHECK(confirmer->calls("10.0.0.9") == 1);
    CHECK(confirmer->total_calls() == 4);
    CHECK(scan->probes() == 0);

    auto stats = discovery.last_run();
    CHECK(stats.candidates == 4);
    CHECK(stats.bridges == 3);
    CHECK_FALSE(stats.escalated);
}

TEST_CASE("BridgeDiscovery EXHAUSTIVE ends on a quiet wait", "[discovery][orchestrator]") {
    // The source never finishes on its own
    auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{10ms, "10.0.0.1"}}, 10s);
    auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"10.0.0.1"});

    BridgeDiscovery discovery({ssdp}, nullptr, confirmer, ShortWait(200ms));

    auto start = std::chrono::steady_clock::now();
    auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(bridges.size() == 1);
    CHECK(bridges[0].address() == "10.0.0.1");
    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 2s);
}

TEST_CASE("BridgeDiscovery escalates to the fallback once", "[discovery][orchestrator]") {
    auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"192.168.1.50"});

    SECTION("Primary sources finish without a bridge") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{10ms, "192.168.1.7"}});
        auto registry = std::make_shared<FakeSource>("registry");
        auto scan = std::make_shared<FakeSource>("scan", Steps{{10ms, "192.168.1.50"}});

        BridgeDiscovery discovery({ssdp, registry}, scan, confirmer, ShortWait(2s));
        auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);

        REQUIRE(bridges.size() == 1);
        CHECK(bridges[0].address() == "192.168.1.50");
        CHECK(scan->probes() == 1);
        CHECK(discovery.last_run().escalated);
        CHECK(discovery.last_run().final_state == DiscoveryState::DONE_SUCCESS);
    }

    SECTION("Primary sources stay silent past the wait") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{}, 10s);
        auto scan = std::make_shared<FakeSource>("scan", Steps{{10ms, "192.168.1.50"}});

        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(200ms));
        auto start = std::chrono::steady_clock::now();
        auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);

        REQUIRE(bridges.size() == 1);
        CHECK(scan->probes() == 1);
        CHECK(std::chrono::steady_clock::now() - start < 2s);
    }

    SECTION("Scan slower than one wait is still awaited") {
        auto ssdp = std::make_shared<FakeSource>("ssdp");
        auto scan = std::make_shared<FakeSource>("scan", Steps{{600ms, "192.168.1.50"}});

        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(200ms));
        auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);

        REQUIRE(bridges.size() == 1);
        CHECK(bridges[0].address() == "192.168.1.50");
    }

    SECTION("Late primary result after escalation still counts") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{400ms, "192.168.1.50"}});
        auto scan = std::make_shared<FakeSource>("scan", Steps{}, 2s);

        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(200ms));
        auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);

        REQUIRE(bridges.size() == 1);
        CHECK(scan->probes() == 1);
    }
}

TEST_CASE("BridgeDiscovery fails when nothing is confirmed", "[discovery][orchestrator]") {
    auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{});

    SECTION("After exactly one escalation") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{5ms, "10.0.0.7"}});
        auto scan = std::make_shared<FakeSource>("scan", Steps{{5ms, "10.0.0.8"}});

        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(200ms));
        CHECK_THROWS_AS(discovery.discover(DiscoveryMode::EXHAUSTIVE), DiscoveryFailed);

        CHECK(scan->probes() == 1);
        auto stats = discovery.last_run();
        CHECK(stats.final_state == DiscoveryState::DONE_FAILURE);
        CHECK(stats.escalated);
        CHECK(stats.candidates == 2);
        CHECK(stats.bridges == 0);
    }

    SECTION("Without a fallback") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{5ms, "10.0.0.7"}});
        BridgeDiscovery discovery({ssdp}, nullptr, confirmer, ShortWait(200ms));

        CHECK_THROWS_AS(discovery.discover(DiscoveryMode::FIRST_MATCH), DiscoveryFailed);
        CHECK_FALSE(discovery.last_run().escalated);
    }

    SECTION("With no sources at all") {
        BridgeDiscovery discovery({}, nullptr, confirmer, ShortWait(200ms));
        CHECK_THROWS_AS(discovery.discover(DiscoveryMode::FIRST_MATCH), DiscoveryFailed);
    }

    SECTION("Failing sources do not abort the run") {
        auto ssdp = std::make_shared<FakeSource>("ssdp");
        ssdp->FailWith("failed to bind UDP socket");
        auto scan = std::make_shared<FakeSource>("scan");
        scan->FailWith("getifaddrs failed");

        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(200ms));
        CHECK_THROWS_AS(discovery.discover(DiscoveryMode::FIRST_MATCH), DiscoveryFailed);
        CHECK(scan->probes() == 1);
    }
}

TEST_CASE("BridgeDiscovery survives a failing source", "[discovery][orchestrator]") {
    auto broken = std::make_shared<FakeSource>("registry");
    broken->FailWith("registry https://registry.test/ returned HTTP 500");
    auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{50ms, "10.0.0.1"}});
    auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"10.0.0.1"});

    BridgeDiscovery discovery({broken, ssdp}, nullptr, confirmer, ShortWait(2s));
    auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);

    REQUIRE(bridges.size() == 1);
    CHECK(bridges[0].address() == "10.0.0.1");
}

TEST_CASE("BridgeDiscovery cancellation", "[discovery][orchestrator]") {
    std::stop_source stop;
    std::thread canceller;

    auto cancel_after = [&](std::chrono::milliseconds delay) {
        canceller = std::thread([&stop, delay] {
            std::this_thread::sleep_for(delay);
            stop.request_stop();
        });
    };

    SECTION("Nothing found yet") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{}, 10s);
        auto scan = std::make_shared<FakeSource>("scan", Steps{}, 10s);
        auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{});
        BridgeDiscovery discovery({ssdp}, scan, confirmer, ShortWait(5s));

        cancel_after(150ms);
        auto start = std::chrono::steady_clock::now();
        try {
            discovery.discover(DiscoveryMode::FIRST_MATCH, stop.get_token());
            FAIL("discover should have thrown");
        } catch (const DiscoveryFailed& e) {
            CHECK(std::string(e.what()) == "discovery cancelled");
        }
        CHECK(std::chrono::steady_clock::now() - start < 3s);
        CHECK(ssdp->stopped_early());
        CHECK(scan->probes() == 0);
    }

    SECTION("Bridges found so far are returned") {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{10ms, "10.0.0.1"}}, 10s);
        auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"10.0.0.1"});
        BridgeDiscovery discovery({ssdp}, nullptr, confirmer, ShortWait(5s));

        cancel_after(300ms);
        auto start = std::chrono::steady_clock::now();
        auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE, stop.get_token());

        REQUIRE(bridges.size() == 1);
        CHECK(bridges[0].address() == "10.0.0.1");
        CHECK(std::chrono::steady_clock::now() - start < 3s);
    }

    SECTION("Slow confirmations are abandoned") {
        auto ssdp = std::make_shared<FakeSource>(
            "ssdp", Steps{{0ms, "10.0.0.1"}, {0ms, "10.0.0.2"}}, 10s);
        auto confirmer = std::make_shared<FakeConfirmer>(
            std::set<std::string>{"10.0.0.1", "10.0.0.2"}, 10s);
        BridgeDiscovery discovery({ssdp}, nullptr, confirmer, ShortWait(5s));

        cancel_after(150ms);
        auto start = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(discovery.discover(DiscoveryMode::EXHAUSTIVE, stop.get_token()),
                        DiscoveryFailed);
        CHECK(std::chrono::steady_clock::now() - start < 3s);
    }

    if (canceller.joinable()) {
        canceller.join();
    }
}

TEST_CASE("BridgeDiscovery runs are independent", "[discovery][orchestrator]") {
    auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{5ms, "10.0.0.1"}});
    auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"10.0.0.1"});
    BridgeDiscovery discovery({ssdp}, nullptr, confirmer, ShortWait(1s));

    for (int run = 0; run < 3; ++run) {
        auto bridges = discovery.discover(DiscoveryMode::EXHAUSTIVE);
        REQUIRE(bridges.size() == 1);
    }
    CHECK(ssdp->probes() == 3);
    // Dedup is per run, so every run confirms again
    CHECK(confirmer->calls("10.0.0.1") == 3);
}

TEST_CASE("Discovery enum names", "[discovery][orchestrator]") {
    CHECK(std::string(DiscoveryModeName(DiscoveryMode::FIRST_MATCH)) == "first-match");
    CHECK(std::string(DiscoveryModeName(DiscoveryMode::EXHAUSTIVE)) == "exhaustive");
    CHECK(std::string(DiscoveryStateName(DiscoveryState::SEARCHING)) == "searching");
    CHECK(std::string(DiscoveryStateName(DiscoveryState::SCAN_ESCALATED)) == "scan-escalated");
    CHECK(std::string(DiscoveryStateName(DiscoveryState::DONE_SUCCESS)) == "done-success");
    CHECK(std::string(DiscoveryStateName(DiscoveryState::DONE_FAILURE)) == "done-failure");
}

TEST_CASE("BridgeDiscovery FIRST_MATCH does not wait for a stalled registry lookup", "[discovery][orchestrator]") {
    StalledResolver dns;
    BeastHttpClient::Options http;
    http.timeout = 10s;
    http.resolve = dns.function();
    auto registry_http = std::make_shared<BeastHttpClient>(http);

    {
        auto ssdp = std::make_shared<FakeSource>("ssdp", Steps{{50ms, "10.0.0.5"}});
        auto registry = std::make_shared<CloudRegistryProber>(
            registry_http, "https://registry.test/");
        auto confirmer = std::make_shared<FakeConfirmer>(std::set<std::string>{"10.0.0.5"});
        BridgeDiscovery discovery({ssdp, registry}, nullptr, confirmer, ShortWait(2s));

        auto start = std::chrono::steady_clock::now();
        auto bridges = discovery.discover(DiscoveryMode::FIRST_MATCH);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(Addresses(bridges) == std::set<std::string>{"10.0.0.5"});
        CHECK(elapsed < 1500ms);
        CHECK(discovery.last_run().final_state == DiscoveryState::DONE_SUCCESS);
    }

    dns.Release();
}
