#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/reading.hpp"

namespace fleet_telemetry::model {

enum class risk_level : std::uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
};

inline const char* to_string(const risk_level level) noexcept {
    switch (level) {
        case risk_level::LOW:
            return "LOW";
        case risk_level::MEDIUM:
            return "MEDIUM";
        case risk_level::HIGH:
            return "HIGH";
    }
    return "LOW";
}

struct metric_averages {
    double temperature_c{0.0};
    double vibration_rms{0.0};
    double pressure_psi{0.0};
};

// Computed on read, never persisted.
struct risk_assessment {
    double risk_score{0.0};
    int risk_points{0};
    risk_level level{risk_level::LOW};
    std::size_t window_used{0};
    metric_averages averages{};  // rounded to 2 decimals
};

struct latest_window {
    std::string asset_id;
    int window_requested{0};
    std::vector<reading> readings;  // most recent first
    std::optional<risk_assessment> risk;

    [[nodiscard]] std::size_t window_used() const noexcept { return readings.size(); }
};

} // namespace fleet_telemetry::model
