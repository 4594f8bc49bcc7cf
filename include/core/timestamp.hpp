#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fleet_telemetry::core {

inline std::int64_t unix_timestamp_now_us() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

// ISO-8601 UTC with microsecond precision, e.g. 2024-05-01T12:00:00.000250+00:00.
std::string format_iso8601_utc(std::int64_t unix_us);

}  // namespace fleet_telemetry::core
