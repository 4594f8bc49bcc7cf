#include "service/json_codec.hpp"

#include <stdexcept>
#include <string>

#include "core/timestamp.hpp"

namespace fleet_telemetry::service {
namespace {

double require_number(const nlohmann::json& params, const char* name) {
  const auto it = params.find(name);
  if (it == params.end() || !it->is_number()) {
    throw std::invalid_argument(std::string(name) + " must be a number");
  }
  return it->get<double>();
}

}  // namespace

nlohmann::json to_json(const model::reading& reading) {
  return nlohmann::json{{"id", reading.id},
                        {"asset_id", reading.asset_id},
                        {"temperature_c", reading.temperature_c},
                        {"vibration_rms", reading.vibration_rms},
                        {"pressure_psi", reading.pressure_psi},
                        {"recorded_at", core::format_iso8601_utc(reading.recorded_at_us)}};
}

nlohmann::json to_json(const model::append_receipt& receipt) {
  return nlohmann::json{{"id", receipt.id}, {"recorded_at", core::format_iso8601_utc(receipt.recorded_at_us)}};
}

nlohmann::json to_json(const model::risk_assessment& assessment) {
  return nlohmann::json{{"risk_score", assessment.risk_score},
                        {"risk_points", assessment.risk_points},
                        {"risk_level", model::to_string(assessment.level)},
                        {"window_used", assessment.window_used},
                        {"averages",
                         {{"temperature_c", assessment.averages.temperature_c},
                          {"vibration_rms", assessment.averages.vibration_rms},
                          {"pressure_psi", assessment.averages.pressure_psi}}}};
}

nlohmann::json to_json(const model::latest_window& window) {
  nlohmann::json readings = nlohmann::json::array();
  for (const auto& reading : window.readings) {
    readings.push_back(to_json(reading));
  }

  return nlohmann::json{{"asset_id", window.asset_id},
                        {"window_requested", window.window_requested},
                        {"window_used", window.window_used()},
                        {"count", window.readings.size()},
                        {"readings", readings},
                        {"risk", window.risk.has_value() ? to_json(*window.risk) : nlohmann::json(nullptr)}};
}

nlohmann::json to_json(const HealthStatus& status) {
  nlohmann::json out{{"status", status.store_ok ? "ok" : "degraded"},
                     {"store", status.store_ok ? "ok" : "unreachable"},
                     {"ts", core::format_iso8601_utc(status.checked_at_us)}};
  if (!status.store_ok) {
    out["error"] = status.error;
  }
  return out;
}

model::reading_input reading_input_from_json(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto asset_it = params.find("asset_id");
  if (asset_it == params.end() || !asset_it->is_string() || asset_it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("asset_id must be a non-empty string");
  }

  model::reading_input input{};
  input.asset_id = asset_it->get<std::string>();
  input.temperature_c = require_number(params, "temperature_c");
  input.vibration_rms = require_number(params, "vibration_rms");
  input.pressure_psi = require_number(params, "pressure_psi");
  return input;
}

}  // namespace fleet_telemetry::service
