#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "core/config.hpp"
#include "model/reading.hpp"
#include "model/risk_assessment.hpp"
#include "risk/risk_evaluator.hpp"

using fleet_telemetry::core::load_service_config;
using fleet_telemetry::core::StoreBackend;
using fleet_telemetry::model::reading;
using fleet_telemetry::model::risk_level;
using fleet_telemetry::risk::evaluate;
using fleet_telemetry::risk::level_for_points;
using fleet_telemetry::risk::pressure_points;
using fleet_telemetry::risk::score_for_points;
using fleet_telemetry::risk::temperature_points;
using fleet_telemetry::risk::vibration_points;

namespace {

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

reading make_reading(const double temperature, const double vibration, const double pressure) {
  reading r{};
  r.asset_id = "aircraft-C130-017";
  r.temperature_c = temperature;
  r.vibration_rms = vibration;
  r.pressure_psi = pressure;
  return r;
}

int test_empty_window_has_no_assessment() {
  if (evaluate({}).has_value()) {
    return fail("test_empty_window_has_no_assessment", "empty window must not produce an assessment");
  }
  return 0;
}

int test_single_band_scenario() {
  const std::vector<reading> window = {make_reading(90.0, 1.0, 45.0), make_reading(92.0, 1.0, 45.0),
                                       make_reading(94.0, 1.0, 45.0)};
  const auto risk = evaluate(window);
  if (!risk.has_value()) {
    return fail("test_single_band_scenario", "expected an assessment");
  }
  if (!almost_equal(risk->averages.temperature_c, 92.0) || !almost_equal(risk->averages.vibration_rms, 1.0) ||
      !almost_equal(risk->averages.pressure_psi, 45.0)) {
    return fail("test_single_band_scenario", "averages mismatch");
  }
  if (risk->risk_points != 1 || !almost_equal(risk->risk_score, 0.17) || risk->level != risk_level::LOW) {
    return fail("test_single_band_scenario", "expected 1 point, score 0.17, LOW");
  }
  if (risk->window_used != 3) {
    return fail("test_single_band_scenario", "window_used should equal the readings evaluated");
  }
  return 0;
}

int test_all_bands_maxed_scenario() {
  const std::vector<reading> window(4, make_reading(100.0, 4.0, 65.0));
  const auto risk = evaluate(window);
  if (!risk.has_value() || risk->risk_points != 6 || !almost_equal(risk->risk_score, 1.0) ||
      risk->level != risk_level::HIGH) {
    return fail("test_all_bands_maxed_scenario", "expected 6 points, score 1.0, HIGH");
  }
  return 0;
}

int test_band_boundaries_are_strict() {
  if (temperature_points(95.0) != 1 || temperature_points(95.0001) != 2) {
    return fail("test_band_boundaries_are_strict", "temperature 95 boundary");
  }
  if (temperature_points(85.0) != 0 || temperature_points(85.0001) != 1) {
    return fail("test_band_boundaries_are_strict", "temperature 85 boundary");
  }
  if (vibration_points(3.5) != 1 || vibration_points(3.5001) != 2) {
    return fail("test_band_boundaries_are_strict", "vibration 3.5 boundary");
  }
  if (vibration_points(2.5) != 0 || vibration_points(2.5001) != 1) {
    return fail("test_band_boundaries_are_strict", "vibration 2.5 boundary");
  }
  return 0;
}

int test_pressure_is_banded_on_both_sides() {
  struct Case {
    double psi;
    int points;
  };
  const Case cases[] = {
      {29.9, 2}, {30.0, 1}, {34.9, 1}, {35.0, 0}, {45.0, 0}, {55.0, 0}, {55.1, 1}, {60.0, 1}, {60.1, 2}, {-5.0, 2},
  };
  for (const auto& c : cases) {
    if (pressure_points(c.psi) != c.points) {
      std::cerr << "  psi=" << c.psi << " got " << pressure_points(c.psi) << '\n';
      return fail("test_pressure_is_banded_on_both_sides", "pressure band mismatch");
    }
  }
  return 0;
}

int test_score_table_and_level_partition() {
  const double expected_scores[] = {0.0, 0.17, 0.33, 0.5, 0.67, 0.83, 1.0};
  const risk_level expected_levels[] = {risk_level::LOW,    risk_level::LOW,  risk_level::LOW, risk_level::MEDIUM,
                                        risk_level::MEDIUM, risk_level::HIGH, risk_level::HIGH};
  for (int points = 0; points <= 6; ++points) {
    if (!almost_equal(score_for_points(points), expected_scores[points])) {
      return fail("test_score_table_and_level_partition", "score mismatch");
    }
    if (level_for_points(points) != expected_levels[points]) {
      return fail("test_score_table_and_level_partition", "level mismatch");
    }
  }
  return 0;
}

int test_thresholds_use_unrounded_mean() {
  // Mean 95.004 rounds to 95.0 for display but still exceeds 95.
  const std::vector<reading> window = {make_reading(95.004, 1.0, 45.0)};
  const auto risk = evaluate(window);
  if (!risk.has_value() || risk->risk_points != 2) {
    return fail("test_thresholds_use_unrounded_mean", "threshold should compare against 95.004");
  }
  if (!almost_equal(risk->averages.temperature_c, 95.0)) {
    return fail("test_thresholds_use_unrounded_mean", "displayed average should be rounded to 2 decimals");
  }
  return 0;
}

int test_permutation_does_not_change_assessment() {
  std::vector<reading> window = {make_reading(70.3, 1.17, 20.9), make_reading(149.1, 4.93, 69.4),
                                 make_reading(88.8, 2.51, 33.3), make_reading(101.7, 3.02, 57.6),
                                 make_reading(93.2, 1.88, 41.0)};
  std::sort(window.begin(), window.end(),
            [](const reading& a, const reading& b) { return a.temperature_c < b.temperature_c; });

  const auto baseline = evaluate(window);
  if (!baseline.has_value()) {
    return fail("test_permutation_does_not_change_assessment", "expected an assessment");
  }

  do {
    const auto risk = evaluate(window);
    if (!risk.has_value() || risk->risk_points != baseline->risk_points ||
        risk->averages.temperature_c != baseline->averages.temperature_c ||
        risk->averages.vibration_rms != baseline->averages.vibration_rms ||
        risk->averages.pressure_psi != baseline->averages.pressure_psi) {
      return fail("test_permutation_does_not_change_assessment", "permutation changed the assessment");
    }
  } while (std::next_permutation(window.begin(), window.end(), [](const reading& a, const reading& b) {
    return a.temperature_c < b.temperature_c;
  }));

  return 0;
}

int test_mixed_window_reaches_medium() {
  // temp avg 90 -> 1, vib avg 3.0 -> 1, psi avg 62 -> 2.
  const std::vector<reading> window = {make_reading(80.0, 2.0, 64.0), make_reading(100.0, 4.0, 60.0)};
  const auto risk = evaluate(window);
  if (!risk.has_value() || risk->risk_points != 4 || risk->level != risk_level::MEDIUM ||
      !almost_equal(risk->risk_score, 0.67)) {
    return fail("test_mixed_window_reaches_medium", "expected 4 points, MEDIUM, 0.67");
  }
  return 0;
}

int test_large_finite_metrics_keep_finite_averages() {
  const std::vector<reading> window = {make_reading(1.5e308, 1.0, 45.0), make_reading(1.5e308, 1.0, 45.0)};
  const auto risk = evaluate(window);
  if (!risk.has_value() || !std::isfinite(risk->averages.temperature_c) ||
      !almost_equal(risk->averages.temperature_c, 1.5e308, 1e294)) {
    return fail("test_large_finite_metrics_keep_finite_averages", "mean of large finite values should stay finite");
  }
  if (risk->risk_points != 2 || risk->level != risk_level::LOW) {
    return fail("test_large_finite_metrics_keep_finite_averages", "expected 2 points from temperature only");
  }
  return 0;
}

// Loads a single-entry config and reports whether it was rejected with std::runtime_error.
bool config_value_rejected(const char* section, const char* key, const char* value) {
  const auto config_path = std::filesystem::temp_directory_path() / "fleet_telemetry_config_value.yaml";
  {
    std::ofstream out(config_path);
    out << section << ":\n";
    out << "  " << key << ": " << value << "\n";
  }

  bool rejected = false;
  try {
    (void)load_service_config(config_path.string());
  } catch (const std::runtime_error&) {
    rejected = true;
  }

  std::error_code ec;
  std::filesystem::remove(config_path, ec);
  return rejected;
}

int test_config_rejects_malformed_integers() {
  if (!config_value_rejected("sim", "interval_seconds", "4294967296")) {
    return fail("test_config_rejects_malformed_integers", "interval above uint32 range must not wrap");
  }
  if (!config_value_rejected("redis", "connect_timeout_ms", "99999999999")) {
    return fail("test_config_rejects_malformed_integers", "timeout above uint32 range must not wrap");
  }
  if (!config_value_rejected("redis", "db", "abc")) {
    return fail("test_config_rejects_malformed_integers", "non-numeric db should be a runtime_error");
  }
  if (!config_value_rejected("service", "default_window", "7abc")) {
    return fail("test_config_rejects_malformed_integers", "trailing junk should be rejected");
  }
  if (!config_value_rejected("redis", "address", "cache.local:99999999999")) {
    return fail("test_config_rejects_malformed_integers", "oversized port should be rejected");
  }
  if (config_value_rejected("sim", "interval_seconds", "4294967295")) {
    return fail("test_config_rejects_malformed_integers", "uint32 max interval should be accepted");
  }
  return 0;
}

int test_config_host_after_unix_socket_restores_port() {
  const auto config_path = std::filesystem::temp_directory_path() / "fleet_telemetry_config_address.yaml";
  {
    std::ofstream out(config_path);
    out << "redis:\n";
    out << "  address: unix:///run/redis.sock\n";
    out << "  address: cache.local\n";
  }

  const auto config = load_service_config(config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (config.redis.host != "cache.local" || !config.redis.unix_socket.empty() || config.redis.port != 6379) {
    return fail("test_config_host_after_unix_socket_restores_port", "host-only address should use port 6379");
  }
  return 0;
}

int test_config_parses_sections() {
  const auto config_path = std::filesystem::temp_directory_path() / "fleet_telemetry_config_ok.yaml";
  {
    std::ofstream out(config_path);
    out << "store:\n";
    out << "  backend: memory\n";
    out << "redis:\n";
    out << "  address: cache.local:6380  # comment\n";
    out << "  key_prefix: fleet-test\n";
    out << "service:\n";
    out << "  default_window: 12\n";
    out << "sim:\n";
    out << "  asset_id: aircraft-C17-002\n";
    out << "  interval_seconds: 3\n";
  }

  const auto config = load_service_config(config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (config.backend != StoreBackend::kMemory || config.redis.host != "cache.local" || config.redis.port != 6380 ||
      config.redis.key_prefix != "fleet-test" || config.default_window != 12 ||
      config.sim.asset_id != "aircraft-C17-002" || config.sim.interval_seconds != 3 || config.sim.window != 5) {
    return fail("test_config_parses_sections", "parsed config mismatch");
  }
  return 0;
}

int test_config_rejects_out_of_range_window() {
  const auto config_path = std::filesystem::temp_directory_path() / "fleet_telemetry_config_bad_window.yaml";
  {
    std::ofstream out(config_path);
    out << "service:\n";
    out << "  default_window: 51\n";
  }

  bool threw = false;
  try {
    (void)load_service_config(config_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (!threw) {
    return fail("test_config_rejects_out_of_range_window", "expected default_window > 50 to be rejected");
  }
  return 0;
}

int test_config_env_overrides_file() {
  const auto config_path = std::filesystem::temp_directory_path() / "fleet_telemetry_config_env.yaml";
  {
    std::ofstream out(config_path);
    out << "redis:\n";
    out << "  address: unix:///run/redis.sock\n";
  }

  auto config = load_service_config(config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (config.redis.unix_socket != "/run/redis.sock") {
    return fail("test_config_env_overrides_file", "unix socket address not parsed");
  }

  ::setenv("FLEET_REDIS_HOST", "db.internal", 1);
  ::setenv("FLEET_WINDOW", "7", 1);
  fleet_telemetry::core::apply_env_overrides(config);
  ::unsetenv("FLEET_REDIS_HOST");
  ::unsetenv("FLEET_WINDOW");

  if (config.redis.host != "db.internal" || !config.redis.unix_socket.empty() || config.redis.port != 6379 ||
      config.sim.window != 7) {
    return fail("test_config_env_overrides_file", "environment overrides not applied");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_empty_window_has_no_assessment(); rc != 0) {
    return rc;
  }
  if (int rc = test_single_band_scenario(); rc != 0) {
    return rc;
  }
  if (int rc = test_all_bands_maxed_scenario(); rc != 0) {
    return rc;
  }
  if (int rc = test_band_boundaries_are_strict(); rc != 0) {
    return rc;
  }
  if (int rc = test_pressure_is_banded_on_both_sides(); rc != 0) {
    return rc;
  }
  if (int rc = test_score_table_and_level_partition(); rc != 0) {
    return rc;
  }
  if (int rc = test_thresholds_use_unrounded_mean(); rc != 0) {
    return rc;
  }
  if (int rc = test_permutation_does_not_change_assessment(); rc != 0) {
    return rc;
  }
  if (int rc = test_large_finite_metrics_keep_finite_averages(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_malformed_integers(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_host_after_unix_socket_restores_port(); rc != 0) {
    return rc;
  }
  if (int rc = test_mixed_window_reaches_medium(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_parses_sections(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_out_of_range_window(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_env_overrides_file(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] risk unit tests\n";
  return 0;
}
