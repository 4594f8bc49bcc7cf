#include "sim/poller.hpp"

#include <ostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"
#include "model/risk_assessment.hpp"
#include "store/reading_store.hpp"

namespace fleet::sim {

Poller::Poller(fleet_telemetry::service::TelemetryService& service, fleet_telemetry::core::SimulatorConfig config,
               ReadingGenerator generator)
    : service_(service), config_(std::move(config)), generator_(std::move(generator)) {}

StepOutcome Poller::step(std::ostream& out) {
  StepOutcome outcome{};
  const auto input = generator_.next();

  try {
    const auto receipt = service_.append_reading(input);
    out << "[sim] append -> id=" << receipt.id
        << " ts=" << fleet_telemetry::core::format_iso8601_utc(receipt.recorded_at_us)
        << " temp=" << input.temperature_c << " vib=" << input.vibration_rms << " psi=" << input.pressure_psi
        << '\n';
    outcome.appended = true;
  } catch (const std::exception& ex) {
    out << "[sim] append failed: " << ex.what() << '\n';
    return outcome;
  }

  try {
    const auto window = service_.latest(config_.asset_id, config_.window);
    out << "[sim] latest -> window_used=" << window.window_used();
    if (!window.readings.empty()) {
      const auto& newest = window.readings.front();
      out << " latest_id=" << newest.id
          << " latest_ts=" << fleet_telemetry::core::format_iso8601_utc(newest.recorded_at_us)
          << " temp=" << newest.temperature_c << " vib=" << newest.vibration_rms << " psi=" << newest.pressure_psi;
    }
    if (window.risk.has_value()) {
      out << " risk=" << window.risk->risk_score << " level=" << fleet_telemetry::model::to_string(window.risk->level);
    } else {
      out << " risk=none";
    }
    out << '\n';
    outcome.fetched = true;
  } catch (const std::exception& ex) {
    out << "[sim] latest failed: " << ex.what() << '\n';
  }

  return outcome;
}

}  // namespace fleet::sim
