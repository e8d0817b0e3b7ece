// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#ifndef BRIDGESCOUT_VERSION_HPP
#define BRIDGESCOUT_VERSION_HPP

#include <string>

namespace bridgescout {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The Bridgescout developers";

// User-Agent header sent with every HTTP request
// Format: bridgescout/1.0.0
inline std::string GetUserAgent() {
  return "bridgescout/" + GetVersionString();
}

// Full version info for display
inline std::string GetFullVersionString() {
  return "bridgescout version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace bridgescout

#endif // BRIDGESCOUT_VERSION_HPP
