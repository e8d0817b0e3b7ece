// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/app_config.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using namespace bridgescout;
using namespace bridgescout::app;
using namespace std::chrono_literals;

namespace {
CommandLine Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "bridgescout");
    return ParseCommandLine(static_cast<int>(args.size()), args.data());
}
} // namespace

TEST_CASE("ParseCommandLine defaults", "[app][config]") {
    auto command = Parse({});
    const auto& config = command.config;

    CHECK(command.action == CommandAction::RUN);
    CHECK(config.mode == discovery::DiscoveryMode::FIRST_MATCH);
    CHECK(config.discovery.use_ssdp);
    CHECK(config.discovery.use_registry);
    CHECK(config.discovery.use_scan);
    CHECK(config.discovery.registry_url == "https://discovery.meethue.com/");
    CHECK(config.discovery.scan.port == 80);
    CHECK(config.discovery.scan.concurrency == 20);
    CHECK(config.discovery.http.timeout == 2000ms);
    CHECK_FALSE(config.discovery.http.accept_self_signed);
    CHECK(config.discovery.discovery.wait_timeout == 3000ms);
    CHECK_FALSE(config.json_output);
    CHECK(config.log_level == "warn");
    CHECK(config.log_file.empty());
}

TEST_CASE("ParseCommandLine options", "[app][config]") {
    auto command = Parse({"--all", "--noregistry", "--scanport=8080", "--scanthreads=64",
                          "--http-timeout=500", "--insecure", "--ratelimit=100", "--json",
                          "--registry=https://registry.test/", "--debug=discovery,http",
                          "--logfile=/tmp/bridgescout.log"});
    const auto& config = command.config;

    CHECK(config.mode == discovery::DiscoveryMode::EXHAUSTIVE);
    CHECK_FALSE(config.discovery.use_registry);
    CHECK(config.discovery.use_ssdp);
    CHECK(config.discovery.scan.port == 8080);
    CHECK(config.discovery.scan.concurrency == 64);
    CHECK(config.discovery.http.timeout == 500ms);
    CHECK(config.discovery.http.accept_self_signed);
    CHECK(config.discovery.http.min_request_interval == 100ms);
    CHECK(config.json_output);
    CHECK(config.discovery.registry_url == "https://registry.test/");
    CHECK(config.debug_components == std::vector<std::string>{"discovery", "http"});
    CHECK(config.log_file == "/tmp/bridgescout.log");
}

TEST_CASE("ParseCommandLine actions", "[app][config]") {
    CHECK(Parse({"--help"}).action == CommandAction::HELP);
    CHECK(Parse({"-h"}).action == CommandAction::HELP);
    CHECK(Parse({"--version"}).action == CommandAction::VERSION);
    // Help wins even after a bad option would have been rejected
    CHECK(Parse({"--help", "--bogus"}).action == CommandAction::HELP);

    auto verbose = Parse({"--verbose"});
    CHECK(verbose.config.verbose);
    CHECK(verbose.config.log_level == "debug");
    CHECK(Parse({"--loglevel=trace"}).config.log_level == "trace");
}

TEST_CASE("ParseCommandLine rejects bad input", "[app][config]") {
    CHECK_THROWS_AS(Parse({"--bogus"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--scanport=0"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--scanport=65536"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--scanport=80x"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--scanthreads="}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--scanthreads=-1"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--http-timeout=99999999999999999999999"}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--registry="}), std::invalid_argument);
    CHECK_THROWS_AS(Parse({"--nossdp", "--noregistry", "--noscan"}), std::invalid_argument);
}

TEST_CASE("FormatBridges", "[app][output]") {
    std::vector<discovery::Bridge> bridges = {discovery::Bridge("192.168.1.2"),
                                              discovery::Bridge("192.168.1.3:8080")};

    SECTION("Plain text lists one address per line") {
        CHECK(FormatBridges(bridges, false) == "192.168.1.2\n192.168.1.3:8080\n");
        CHECK(FormatBridges({}, false).empty());
    }

    SECTION("JSON array of objects") {
        auto parsed = nlohmann::json::parse(FormatBridges(bridges, true));
        REQUIRE(parsed.is_array());
        REQUIRE(parsed.size() == 2);
        CHECK(parsed[0]["address"] == "192.168.1.2");
        CHECK(parsed[1]["address"] == "192.168.1.3:8080");
        CHECK_FALSE(parsed[0].contains("username"));
    }

    SECTION("Paired bridges carry their username") {
        auto parsed = nlohmann::json::parse(FormatBridges(
            {discovery::Bridge::WithUsername("192.168.1.2", "newdeveloper")}, true));
        CHECK(parsed[0]["username"] == "newdeveloper");
    }
}

TEST_CASE("Usage mentions every option", "[app][config]") {
    const std::string usage = Usage("bridgescout");
    for (const char* option : {"--all", "--nossdp", "--noregistry", "--registry=", "--noscan",
                               "--scanport=", "--scanthreads=", "--http-timeout=", "--insecure",
                               "--ratelimit=", "--json", "--loglevel=", "--debug=", "--verbose",
                               "--logfile=", "--version", "--help"}) {
        CHECK(usage.find(option) != std::string::npos);
    }
}
