// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace whisperlink {
namespace util {

/**
 * Wall-clock time for timestamps that leave the process: envelope
 * "timestamp", contact added_at/last_seen and Connection::established_at.
 *
 * Tests pin the clock with SetMockTime()/MockTimeScope; 0 means real time.
 */

// Seconds since the Unix epoch (mock value when set)
int64_t GetTime();

void SetMockTime(int64_t time);
int64_t GetMockTime();

// "2024-10-25T12:00:00Z"; "invalid" if the value cannot be represented
std::string FormatISO8601(int64_t unix_time);

std::string GetTimeISO8601();

// Pins the clock for one scope and restores the previous setting
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_;
};

} // namespace util
} // namespace whisperlink
