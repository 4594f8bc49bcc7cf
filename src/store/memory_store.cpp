#include "store/memory_store.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "core/timestamp.hpp"

namespace fleet_telemetry::store {

MemoryReadingStore::MemoryReadingStore(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::unix_timestamp_now_us;
  }
}

model::append_receipt MemoryReadingStore::append(const model::reading_input& input) {
  std::lock_guard<std::mutex> lock(mutex_);

  model::reading stored{};
  stored.id = next_id_++;
  stored.asset_id = input.asset_id;
  stored.temperature_c = input.temperature_c;
  stored.vibration_rms = input.vibration_rms;
  stored.pressure_psi = input.pressure_psi;
  stored.recorded_at_us = clock_();

  by_asset_[input.asset_id].push_back(stored);
  return model::append_receipt{.id = stored.id, .recorded_at_us = stored.recorded_at_us};
}

std::vector<model::reading> MemoryReadingStore::fetch_latest(const std::string& asset_id, const int limit) {
  validate_window(limit);

  std::vector<model::reading> window;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_asset_.find(asset_id);
    if (it == by_asset_.end()) {
      return window;
    }
    window = it->second;
  }

  const auto newest_first = [](const model::reading& a, const model::reading& b) {
    if (a.recorded_at_us != b.recorded_at_us) {
      return a.recorded_at_us > b.recorded_at_us;
    }
    return a.id > b.id;
  };

  const auto keep = std::min(window.size(), static_cast<std::size_t>(limit));
  std::partial_sort(window.begin(), window.begin() + static_cast<std::ptrdiff_t>(keep), window.end(), newest_first);
  window.resize(keep);
  return window;
}

std::size_t MemoryReadingStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, readings] : by_asset_) {
    total += readings.size();
  }
  return total;
}

}  // namespace fleet_telemetry::store
