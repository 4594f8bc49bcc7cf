#include "rpc/methods.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "rpc/jsonrpc.hpp"
#include "service/json_codec.hpp"
#include "store/reading_store.hpp"

namespace fleet_telemetry::rpc {

namespace {

std::string require_asset_id(const nlohmann::json& params) {
  const auto it = params.find("asset_id");
  if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("asset_id must be a non-empty string");
  }
  return it->get<std::string>();
}

nlohmann::json handle_health(service::TelemetryService& telemetry, const nlohmann::json& /*params*/) {
  return service::to_json(telemetry.health());
}

nlohmann::json handle_append(service::TelemetryService& telemetry, const nlohmann::json& params) {
  const auto input = service::reading_input_from_json(params);
  try {
    return service::to_json(telemetry.append_reading(input));
  } catch (const store::StoreUnavailable& ex) {
    throw MethodError(kStoreUnavailable, std::string("db_insert_failed: ") + ex.what());
  }
}

nlohmann::json handle_latest(service::TelemetryService& telemetry, const nlohmann::json& params) {
  const auto asset_id = require_asset_id(params);

  int limit = telemetry.default_window();
  if (const auto limit_it = params.find("limit"); limit_it != params.end()) {
    if (!limit_it->is_number_integer()) {
      throw std::invalid_argument("limit must be an integer");
    }
    const auto requested = limit_it->get<long long>();
    if (requested < store::kMinWindow || requested > store::kMaxWindow) {
      throw store::InvalidWindow("limit must be in range " + std::to_string(store::kMinWindow) + ".." +
                                 std::to_string(store::kMaxWindow));
    }
    limit = static_cast<int>(requested);
  }

  try {
    return service::to_json(telemetry.latest(asset_id, limit));
  } catch (const store::StoreUnavailable& ex) {
    throw MethodError(kStoreUnavailable, std::string("db_read_failed: ") + ex.what());
  }
}

}  // namespace

MethodRegistry build_method_registry(service::TelemetryService& telemetry) {
  MethodRegistry registry;

  Method health{.name = "health",
                .description = "Report service and store connectivity.",
                .handler = [&telemetry](const nlohmann::json& params) { return handle_health(telemetry, params); }};

  Method append{.name = "telemetry.append",
                .description = "Store one reading; returns the assigned id and timestamp.",
                .handler = [&telemetry](const nlohmann::json& params) { return handle_append(telemetry, params); }};

  Method latest{.name = "telemetry.latest",
                .description = "Return the latest readings for an asset and the risk assessment over them.",
                .handler = [&telemetry](const nlohmann::json& params) { return handle_latest(telemetry, params); }};

  registry.emplace(health.name, std::move(health));
  registry.emplace(append.name, std::move(append));
  registry.emplace(latest.name, std::move(latest));
  return registry;
}

}  // namespace fleet_telemetry::rpc
