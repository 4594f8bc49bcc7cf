#include "risk/risk_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "core/math.hpp"

namespace fleet_telemetry::risk {

namespace {
// Summing in sorted order keeps the mean identical for any permutation of the
// window. Finite inputs whose sum overflows are averaged term by term instead.
double ordered_mean(std::vector<double>& values) {
  std::sort(values.begin(), values.end());
  const auto count = static_cast<double>(values.size());
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  if (std::isfinite(sum)) {
    return sum / count;
  }
  return std::accumulate(values.begin(), values.end(), 0.0,
                         [count](const double acc, const double value) { return acc + value / count; });
}
}  // namespace

int temperature_points(const double avg_temperature_c) noexcept {
  if (avg_temperature_c > 95.0) {
    return 2;
  }
  if (avg_temperature_c > 85.0) {
    return 1;
  }
  return 0;
}

int vibration_points(const double avg_vibration_rms) noexcept {
  if (avg_vibration_rms > 3.5) {
    return 2;
  }
  if (avg_vibration_rms > 2.5) {
    return 1;
  }
  return 0;
}

// Both extremes are risky; the inner band is 5 psi wide on each side.
int pressure_points(const double avg_pressure_psi) noexcept {
  if (avg_pressure_psi < 30.0 || avg_pressure_psi > 60.0) {
    return 2;
  }
  if (avg_pressure_psi < 35.0 || avg_pressure_psi > 55.0) {
    return 1;
  }
  return 0;
}

model::risk_level level_for_points(const int risk_points) noexcept {
  if (risk_points <= 2) {
    return model::risk_level::LOW;
  }
  if (risk_points <= 4) {
    return model::risk_level::MEDIUM;
  }
  return model::risk_level::HIGH;
}

double score_for_points(const int risk_points) noexcept {
  return core::round2(static_cast<double>(risk_points) / static_cast<double>(kMaxRiskPoints));
}

std::optional<model::risk_assessment> evaluate(const std::vector<model::reading>& readings) {
  if (readings.empty()) {
    return std::nullopt;
  }

  std::vector<double> temperatures;
  std::vector<double> vibrations;
  std::vector<double> pressures;
  temperatures.reserve(readings.size());
  vibrations.reserve(readings.size());
  pressures.reserve(readings.size());
  for (const auto& reading : readings) {
    temperatures.push_back(reading.temperature_c);
    vibrations.push_back(reading.vibration_rms);
    pressures.push_back(reading.pressure_psi);
  }

  const double avg_temperature = ordered_mean(temperatures);
  const double avg_vibration = ordered_mean(vibrations);
  const double avg_pressure = ordered_mean(pressures);

  // Thresholds compare against the unrounded means.
  const int points =
      temperature_points(avg_temperature) + vibration_points(avg_vibration) + pressure_points(avg_pressure);

  model::risk_assessment assessment{};
  assessment.risk_points = points;
  assessment.risk_score = score_for_points(points);
  assessment.level = level_for_points(points);
  assessment.window_used = readings.size();
  assessment.averages.temperature_c = core::round2(avg_temperature);
  assessment.averages.vibration_rms = core::round2(avg_vibration);
  assessment.averages.pressure_psi = core::round2(avg_pressure);
  return assessment;
}

}  // namespace fleet_telemetry::risk
