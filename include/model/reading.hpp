#pragma once

#include <cstdint>
#include <string>

namespace fleet_telemetry::model {

// Submitted by a caller; the store assigns id and recorded_at.
struct reading_input {
    std::string asset_id;
    double temperature_c{0.0};
    double vibration_rms{0.0};
    double pressure_psi{0.0};
};

struct append_receipt {
    std::int64_t id{0};
    std::int64_t recorded_at_us{0};
};

// Stored row. Immutable once written.
struct reading {
    std::int64_t id{0};
    std::string asset_id;
    double temperature_c{0.0};
    double vibration_rms{0.0};
    double pressure_psi{0.0};

    // Microseconds since the Unix epoch, UTC, assigned at insertion.
    std::int64_t recorded_at_us{0};
};

} // namespace fleet_telemetry::model
