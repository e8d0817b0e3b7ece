// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using namespace bridgescout::util;

TEST_CASE("LogManager hands out per-component loggers", "[util][logging]") {
    auto discovery = LogManager::GetLogger("discovery");
    auto http = LogManager::GetLogger("http");
    REQUIRE(discovery);
    REQUIRE(http);
    CHECK(discovery->name() == "discovery");
    CHECK(http->name() == "http");
    CHECK(discovery != http);

    SECTION("Unknown components fall back to the default logger") {
        CHECK(LogManager::GetLogger("nonexistent") == LogManager::GetLogger());
    }
}

TEST_CASE("LogManager component levels", "[util][logging]") {
    const auto original = LogManager::GetLogger("http")->level();
    const auto discovery_level = LogManager::GetLogger("discovery")->level();

    REQUIRE(LogManager::SetComponentLevel("http", "trace"));
    CHECK(LogManager::GetLogger("http")->level() == spdlog::level::trace);
    CHECK(LogManager::GetLogger("discovery")->level() == discovery_level);

    CHECK_FALSE(LogManager::SetComponentLevel("rpc", "trace"));

    LogManager::GetLogger("http")->set_level(original);
}
