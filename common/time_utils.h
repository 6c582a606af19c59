#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace Shield::Common {

// Monotonic nanoseconds, used for scan durations
inline uint64_t getMonotonicNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Format current wall clock as YYYYmmdd_HHMMSS into buffer
inline auto formatFileTimestamp(char* buffer, size_t size) noexcept -> bool {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);
  struct tm tm_buf;
  if (!localtime_r(&time_t_now, &tm_buf)) {
    return false;
  }
  return std::strftime(buffer, size, "%Y%m%d_%H%M%S", &tm_buf) > 0;
}

/// Format current wall clock as ISO-8601 UTC into buffer
inline auto formatIsoTimestamp(char* buffer, size_t size) noexcept -> bool {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);
  struct tm tm_buf;
  if (!gmtime_r(&time_t_now, &tm_buf)) {
    return false;
  }
  return std::strftime(buffer, size, "%Y-%m-%dT%H:%M:%SZ", &tm_buf) > 0;
}

/// Scoped elapsed-time measurement
class ElapsedTimer {
public:
  ElapsedTimer() noexcept : start_ns_(getMonotonicNanos()) {}

  uint64_t elapsedNanos() const noexcept {
    return getMonotonicNanos() - start_ns_;
  }

  double elapsedMillis() const noexcept {
    return static_cast<double>(elapsedNanos()) / 1'000'000.0;
  }

private:
  uint64_t start_ns_;
};

} // namespace Shield::Common
