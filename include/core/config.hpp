#pragma once

#include <cstdint>
#include <string>

namespace fleet_telemetry::core {

enum class StoreBackend {
  kRedis,
  kMemory,
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"fleet"};
  std::uint32_t connect_timeout_ms{3000};
};

struct SimulatorConfig {
  std::string asset_id{"aircraft-C130-017"};
  std::uint32_t interval_seconds{10};
  int window{5};
};

struct ServiceConfig {
  StoreBackend backend{StoreBackend::kRedis};
  RedisConfig redis{};
  int default_window{5};
  SimulatorConfig sim{};
};

// Reads an indented "key: value" file. Throws std::runtime_error on invalid
// values or when the file cannot be opened.
ServiceConfig load_service_config(const std::string& path);

// Applies FLEET_* environment overrides on top of an existing config.
void apply_env_overrides(ServiceConfig& config);

const char* to_string(StoreBackend backend) noexcept;

}  // namespace fleet_telemetry::core
