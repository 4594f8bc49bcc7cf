#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "service/telemetry_service.hpp"
#include "sim/poller.hpp"
#include "sim/reading_generator.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void sleep_interruptibly(const std::chrono::seconds interval) {
  const auto deadline = std::chrono::steady_clock::now() + interval;
  while (g_shutdown_requested == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

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

  std::cout << "[sim] starting. store=" << fleet_telemetry::core::to_string(config.backend)
            << " asset_id=" << config.sim.asset_id << " interval=" << config.sim.interval_seconds
            << "s window=" << config.sim.window << std::endl;

  fleet_telemetry::service::TelemetryService service(fleet_telemetry::service::make_reading_store(config),
                                                     config.default_window);
  fleet::sim::Poller poller(service, config.sim, fleet::sim::ReadingGenerator(config.sim.asset_id));

  while (g_shutdown_requested == 0) {
    poller.step(std::cout);
    std::cout.flush();
    sleep_interruptibly(std::chrono::seconds(config.sim.interval_seconds));
  }

  std::cerr << "[sim] shutdown signal received; exiting cleanly\n";
  return 0;
}
