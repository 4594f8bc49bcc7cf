#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "store/reading_store.hpp"

namespace fleet_telemetry::store {

class MemoryReadingStore final : public ReadingStore {
 public:
  using Clock = std::function<std::int64_t()>;

  // clock returns microseconds since the Unix epoch; defaults to the system clock.
  explicit MemoryReadingStore(Clock clock = {});

  model::append_receipt append(const model::reading_input& input) override;
  std::vector<model::reading> fetch_latest(const std::string& asset_id, int limit) override;
  void ping() override {}

  [[nodiscard]] std::size_t size() const;

 private:
  Clock clock_;
  mutable std::mutex mutex_;
  std::int64_t next_id_{1};
  std::unordered_map<std::string, std::vector<model::reading>> by_asset_;
};

}  // namespace fleet_telemetry::store
