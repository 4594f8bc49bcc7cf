#include "core/timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace fleet_telemetry::core {

std::string format_iso8601_utc(const std::int64_t unix_us) {
  std::int64_t seconds = unix_us / 1'000'000;
  std::int64_t micros = unix_us % 1'000'000;
  if (micros < 0) {
    micros += 1'000'000;
    --seconds;
  }

  const auto as_time_t = static_cast<std::time_t>(seconds);
  std::tm utc{};
  if (gmtime_r(&as_time_t, &utc) == nullptr) {
    return {};
  }

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00", utc.tm_year + 1900,
                utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return std::string(buffer);
}

}  // namespace fleet_telemetry::core
