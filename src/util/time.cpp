// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace whisperlink {
namespace util {

namespace {
std::atomic<int64_t> g_mock_time{0};
} // namespace

int64_t GetTime() {
  if (int64_t mock = g_mock_time.load(std::memory_order_relaxed); mock != 0) {
    return mock;
  }
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t time) { g_mock_time.store(time, std::memory_order_relaxed); }

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatISO8601(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm utc{};
  if (!gmtime_r(&t, &utc)) {
    return "invalid";
  }
  char buf[32];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", utc.tm_year + 1900,
                        utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec);
  if (n <= 0 || static_cast<size_t>(n) >= sizeof(buf)) {
    return "invalid";
  }
  return std::string(buf, static_cast<size_t>(n));
}

std::string GetTimeISO8601() { return FormatISO8601(GetTime()); }

} // namespace util
} // namespace whisperlink
