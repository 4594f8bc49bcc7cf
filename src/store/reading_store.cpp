#include "store/reading_store.hpp"

namespace fleet_telemetry::store {

void validate_window(const int limit) {
  if (limit < kMinWindow || limit > kMaxWindow) {
    throw InvalidWindow("limit must be in range " + std::to_string(kMinWindow) + ".." + std::to_string(kMaxWindow) +
                        ", got " + std::to_string(limit));
  }
}

}  // namespace fleet_telemetry::store
