#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "model/reading.hpp"

namespace fleet::sim {

// Uniform random readings in the ranges the fleet poller emits:
// temperature 70..150 C (0.1 steps), vibration 1..5 rms (0.01 steps),
// pressure 20..70 psi (0.1 steps).
class ReadingGenerator {
 public:
  explicit ReadingGenerator(std::string asset_id, std::uint32_t seed = std::random_device{}());

  fleet_telemetry::model::reading_input next();

 private:
  std::string asset_id_;
  std::mt19937 engine_;
  std::uniform_real_distribution<double> temperature_{70.0, 150.0};
  std::uniform_real_distribution<double> vibration_{1.0, 5.0};
  std::uniform_real_distribution<double> pressure_{20.0, 70.0};
};

}  // namespace fleet::sim
