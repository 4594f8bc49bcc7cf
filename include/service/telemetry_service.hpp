#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "model/reading.hpp"
#include "model/risk_assessment.hpp"
#include "store/reading_store.hpp"

namespace fleet_telemetry::service {

struct HealthStatus {
  bool store_ok{false};
  std::int64_t checked_at_us{0};
  // Failure reported by the store ping; empty when store_ok.
  std::string error{};
};

// Ingestion and retrieval on top of an injected store. Holds no per-request
// state; safe to share across callers when the store is.
class TelemetryService {
 public:
  explicit TelemetryService(std::shared_ptr<store::ReadingStore> store, int default_window = store::kDefaultWindow);

  // One reading, one store write. Throws std::invalid_argument for an empty
  // asset id or non-finite metric, StoreUnavailable when the write fails.
  model::append_receipt append_reading(const model::reading_input& input);

  // Fetches up to limit readings and evaluates risk over what was returned.
  model::latest_window latest(const std::string& asset_id, int limit);
  model::latest_window latest(const std::string& asset_id);

  HealthStatus health();

  [[nodiscard]] int default_window() const noexcept { return default_window_; }

 private:
  std::shared_ptr<store::ReadingStore> store_;
  int default_window_;
};

std::shared_ptr<store::ReadingStore> make_reading_store(const core::ServiceConfig& config);

}  // namespace fleet_telemetry::service
