#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "service/telemetry_service.hpp"

namespace fleet_telemetry::rpc {

struct Method {
  std::string name;
  std::string description;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using MethodRegistry = std::unordered_map<std::string, Method>;

// health, telemetry.append and telemetry.latest bound to the given service.
// The service must outlive the registry.
MethodRegistry build_method_registry(service::TelemetryService& telemetry);

}  // namespace fleet_telemetry::rpc
