#include "sim/reading_generator.hpp"

#include <cmath>
#include <utility>

namespace fleet::sim {

namespace {
double round_to(const double value, const double scale) {
  return std::round(value * scale) / scale;
}
}  // namespace

ReadingGenerator::ReadingGenerator(std::string asset_id, const std::uint32_t seed)
    : asset_id_(std::move(asset_id)), engine_(seed) {}

fleet_telemetry::model::reading_input ReadingGenerator::next() {
  fleet_telemetry::model::reading_input input{};
  input.asset_id = asset_id_;
  input.temperature_c = round_to(temperature_(engine_), 10.0);
  input.vibration_rms = round_to(vibration_(engine_), 100.0);
  input.pressure_psi = round_to(pressure_(engine_), 10.0);
  return input;
}

}  // namespace fleet::sim
