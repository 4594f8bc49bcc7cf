#pragma once

#include <optional>
#include <vector>

#include "model/reading.hpp"
#include "model/risk_assessment.hpp"

namespace fleet_telemetry::risk {

constexpr int kMaxRiskPoints = 6;

// Per-metric bands. Each returns 0, 1 or 2 and compares strictly.
[[nodiscard]] int temperature_points(double avg_temperature_c) noexcept;
[[nodiscard]] int vibration_points(double avg_vibration_rms) noexcept;
[[nodiscard]] int pressure_points(double avg_pressure_psi) noexcept;

[[nodiscard]] model::risk_level level_for_points(int risk_points) noexcept;
[[nodiscard]] double score_for_points(int risk_points) noexcept;

// Reduces a window of readings to an assessment. An empty window has no
// assessment. Order of the readings does not affect the result.
[[nodiscard]] std::optional<model::risk_assessment> evaluate(const std::vector<model::reading>& readings);

}  // namespace fleet_telemetry::risk
