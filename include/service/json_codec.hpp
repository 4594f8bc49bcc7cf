#pragma once

#include <nlohmann/json.hpp>

#include "model/reading.hpp"
#include "model/risk_assessment.hpp"
#include "service/telemetry_service.hpp"

namespace fleet_telemetry::service {

nlohmann::json to_json(const model::reading& reading);
nlohmann::json to_json(const model::append_receipt& receipt);
nlohmann::json to_json(const model::risk_assessment& assessment);
nlohmann::json to_json(const model::latest_window& window);
nlohmann::json to_json(const HealthStatus& status);

// Throws std::invalid_argument when a field is missing or has the wrong type.
model::reading_input reading_input_from_json(const nlohmann::json& params);

}  // namespace fleet_telemetry::service
