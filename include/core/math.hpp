#pragma once

#include <cmath>

namespace fleet_telemetry::core {

// Rounds half away from zero to two decimal places. Magnitudes of 1e15 and
// above carry no hundredths and are returned unchanged.
inline double round2(const double value) noexcept {
  if (!(std::fabs(value) < 1e15)) {
    return value;
  }
  return std::round(value * 100.0) / 100.0;
}

}  // namespace fleet_telemetry::core
