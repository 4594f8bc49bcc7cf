#pragma once

#include <iosfwd>

#include "core/config.hpp"
#include "service/telemetry_service.hpp"
#include "sim/reading_generator.hpp"

namespace fleet::sim {

struct StepOutcome {
  bool appended{false};
  bool fetched{false};
};

// One poll cycle: submit a generated reading, then read back the latest
// window with its risk. Failures are reported on out and do not throw.
class Poller {
 public:
  Poller(fleet_telemetry::service::TelemetryService& service, fleet_telemetry::core::SimulatorConfig config,
         ReadingGenerator generator);

  StepOutcome step(std::ostream& out);

 private:
  fleet_telemetry::service::TelemetryService& service_;
  fleet_telemetry::core::SimulatorConfig config_;
  ReadingGenerator generator_;
};

}  // namespace fleet::sim
