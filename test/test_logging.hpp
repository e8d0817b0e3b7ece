// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#pragma once

#include <string>

// Log level used by the test binary unless BRIDGESCOUT_TEST_LOGLEVEL is set
inline constexpr const char* DEFAULT_TEST_LOG_LEVEL = "error";

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();
