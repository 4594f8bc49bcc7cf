#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "model/reading.hpp"

namespace fleet_telemetry::store {

constexpr int kMinWindow = 1;
constexpr int kMaxWindow = 50;
constexpr int kDefaultWindow = 5;

// Backing store could not be reached or rejected the operation. Retryable.
class StoreUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Requested window outside [kMinWindow, kMaxWindow].
class InvalidWindow : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Throws InvalidWindow when limit is out of range.
void validate_window(int limit);

class ReadingStore {
 public:
  virtual ~ReadingStore() = default;

  // Assigns id and recorded_at. Either the reading is fully stored or
  // StoreUnavailable is thrown.
  virtual model::append_receipt append(const model::reading_input& input) = 0;

  // Up to limit readings for asset_id, most recent first. Readings that share
  // a timestamp are ordered by id descending. An unknown asset yields an empty
  // vector.
  virtual std::vector<model::reading> fetch_latest(const std::string& asset_id, int limit) = 0;

  // Connectivity check. Throws StoreUnavailable with the cause when the
  // backend cannot be reached.
  virtual void ping() = 0;
};

}  // namespace fleet_telemetry::store
