#include "service/telemetry_service.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"
#include "risk/risk_evaluator.hpp"
#include "store/memory_store.hpp"
#include "store/redis_store.hpp"

namespace fleet_telemetry::service {
namespace {

void require_asset_id(const std::string& asset_id) {
  if (asset_id.empty()) {
    throw std::invalid_argument("asset_id must not be empty");
  }
}

void require_finite(const char* name, const double value) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument(std::string(name) + " must be a finite number");
  }
}

}  // namespace

TelemetryService::TelemetryService(std::shared_ptr<store::ReadingStore> store, const int default_window)
    : store_(std::move(store)), default_window_(default_window) {
  if (store_ == nullptr) {
    throw std::invalid_argument("TelemetryService requires a reading store");
  }
  store::validate_window(default_window_);
}

model::append_receipt TelemetryService::append_reading(const model::reading_input& input) {
  require_asset_id(input.asset_id);
  require_finite("temperature_c", input.temperature_c);
  require_finite("vibration_rms", input.vibration_rms);
  require_finite("pressure_psi", input.pressure_psi);

  try {
    return store_->append(input);
  } catch (const store::StoreUnavailable& ex) {
    std::cerr << "[service] append failed for asset " << input.asset_id << ": " << ex.what() << '\n';
    throw;
  }
}

model::latest_window TelemetryService::latest(const std::string& asset_id, const int limit) {
  require_asset_id(asset_id);
  store::validate_window(limit);

  model::latest_window window{};
  window.asset_id = asset_id;
  window.window_requested = limit;
  try {
    window.readings = store_->fetch_latest(asset_id, limit);
  } catch (const store::StoreUnavailable& ex) {
    std::cerr << "[service] fetch failed for asset " << asset_id << ": " << ex.what() << '\n';
    throw;
  }

  window.risk = risk::evaluate(window.readings);
  return window;
}

model::latest_window TelemetryService::latest(const std::string& asset_id) {
  return latest(asset_id, default_window_);
}

HealthStatus TelemetryService::health() {
  HealthStatus status{};
  status.checked_at_us = core::unix_timestamp_now_us();
  try {
    store_->ping();
    status.store_ok = true;
  } catch (const store::StoreUnavailable& ex) {
    status.error = ex.what();
    std::cerr << "[service] health check: store unreachable: " << status.error << '\n';
  }
  return status;
}

std::shared_ptr<store::ReadingStore> make_reading_store(const core::ServiceConfig& config) {
  if (config.backend == core::StoreBackend::kMemory) {
    return std::make_shared<store::MemoryReadingStore>();
  }

  store::RedisStoreOptions options{};
  options.host = config.redis.host;
  options.port = config.redis.port;
  options.unix_socket = config.redis.unix_socket;
  options.password = config.redis.password;
  options.db = config.redis.db;
  options.key_prefix = config.redis.key_prefix;
  options.connect_timeout_ms = config.redis.connect_timeout_ms;
  return std::make_shared<store::RedisReadingStore>(options);
}

}  // namespace fleet_telemetry::service
