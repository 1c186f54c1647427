// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace whisperlink {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The WhisperLink developers";

inline std::string GetFullVersionString() {
  return "WhisperLink node version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// One-line startup banner for the node log and console
inline std::string GetStartupBanner(uint16_t port, bool tunnel) {
  std::string banner = GetFullVersionString() + " | port " + std::to_string(port);
  banner += tunnel ? " | tunnel on" : " | direct only";
  return banner;
}

} // namespace whisperlink
