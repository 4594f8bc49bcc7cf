#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "rpc/methods.hpp"
#include "rpc/server.hpp"
#include "service/telemetry_service.hpp"

std::string format_config_settings(const fleet_telemetry::core::ServiceConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[fleet] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | store_backend=" << fleet_telemetry::core::to_string(config.backend)
         << " | default_window=" << config.default_window << " | redis_prefix=" << config.redis.key_prefix
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  fleet_telemetry::core::ServiceConfig config{};
  try {
    if (!config_path.empty()) {
      config = fleet_telemetry::core::load_service_config(config_path);
    }
    fleet_telemetry::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  fleet_telemetry::service::TelemetryService service(fleet_telemetry::service::make_reading_store(config),
                                                     config.default_window);
  if (service.health().store_ok) {
    std::cerr << "[fleet] store connectivity confirmed\n";
  } else {
    std::cerr << "[fleet] store connectivity check failed; serving degraded\n";
  }

  const fleet_telemetry::rpc::Server server(fleet_telemetry::rpc::build_method_registry(service));
  return server.run(std::cin, std::cout, std::cerr);
}
