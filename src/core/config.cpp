#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "store/reading_store.hpp"

namespace fleet_telemetry::core {
namespace {

constexpr std::uint16_t kDefaultRedisPort = 6379;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

StoreBackend parse_backend(const std::string& value) {
  const std::string lower = to_lower(value);
  if (lower == "redis") {
    return StoreBackend::kRedis;
  }
  if (lower == "memory") {
    return StoreBackend::kMemory;
  }
  throw std::runtime_error("store.backend must be one of: redis, memory");
}

// Whole-string integer parse; stoll's leading-prefix behavior would accept
// trailing junk such as "7abc".
long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t pos = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &pos);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (pos != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  return parsed;
}

std::uint32_t parse_positive_u32(const std::string& key, const std::string& value) {
  const auto parsed = parse_integer(key, value);
  if (parsed <= 0 || parsed > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error(key + " must be in range 1.." +
                             std::to_string(std::numeric_limits<std::uint32_t>::max()));
  }
  return static_cast<std::uint32_t>(parsed);
}

std::uint16_t parse_port(const std::string& value) {
  const auto parsed_port = parse_integer("redis port", value);
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis port must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed_port);
}

int parse_window(const std::string& key, const std::string& value) {
  const auto window = parse_integer(key, value);
  if (window < store::kMinWindow || window > store::kMaxWindow) {
    throw std::runtime_error(key + " must be in range " + std::to_string(store::kMinWindow) + ".." +
                             std::to_string(store::kMaxWindow));
  }
  return static_cast<int>(window);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    redis.port = kDefaultRedisPort;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port(value.substr(split + 1));
}

void apply_key_value(ServiceConfig& config, const std::string& key, const std::string& value) {
  if (key == "store.backend") {
    config.backend = parse_backend(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0 || db > std::numeric_limits<int>::max()) {
      throw std::runtime_error("redis.db must be in range 0.." + std::to_string(std::numeric_limits<int>::max()));
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    config.redis.connect_timeout_ms = parse_positive_u32(key, value);
    return;
  }

  if (key == "service.default_window") {
    config.default_window = parse_window(key, value);
    return;
  }

  if (key == "sim.asset_id") {
    if (value.empty()) {
      throw std::runtime_error("sim.asset_id must not be empty");
    }
    config.sim.asset_id = value;
    return;
  }

  if (key == "sim.interval_seconds") {
    config.sim.interval_seconds = parse_positive_u32(key, value);
    return;
  }

  if (key == "sim.window") {
    config.sim.window = parse_window(key, value);
  }
}

void apply_env(ServiceConfig& config, const char* name, const std::string& key) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    apply_key_value(config, key, value);
  }
}

}  // namespace

ServiceConfig load_service_config(const std::string& path) {
  ServiceConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(ServiceConfig& config) {
  apply_env(config, "FLEET_STORE_BACKEND", "store.backend");

  if (const auto* host = std::getenv("FLEET_REDIS_HOST"); host != nullptr) {
    config.redis.host = host;
    config.redis.unix_socket.clear();
    if (config.redis.port == 0) {
      config.redis.port = kDefaultRedisPort;
    }
  }
  if (const auto* port = std::getenv("FLEET_REDIS_PORT"); port != nullptr) {
    config.redis.port = parse_port(port);
  }
  if (const auto* socket = std::getenv("FLEET_REDIS_UNIX_SOCKET"); socket != nullptr) {
    apply_redis_address(config.redis, std::string("unix://") + socket);
  }

  apply_env(config, "FLEET_REDIS_PASSWORD", "redis.password");
  apply_env(config, "FLEET_REDIS_DB", "redis.db");
  apply_env(config, "FLEET_REDIS_PREFIX", "redis.key_prefix");
  apply_env(config, "FLEET_REDIS_CONNECT_TIMEOUT_MS", "redis.connect_timeout_ms");
  apply_env(config, "FLEET_ASSET_ID", "sim.asset_id");
  apply_env(config, "FLEET_INTERVAL_SECONDS", "sim.interval_seconds");
  apply_env(config, "FLEET_WINDOW", "sim.window");
}

const char* to_string(const StoreBackend backend) noexcept {
  switch (backend) {
    case StoreBackend::kRedis:
      return "redis";
    case StoreBackend::kMemory:
      return "memory";
  }
  return "redis";
}

}  // namespace fleet_telemetry::core
