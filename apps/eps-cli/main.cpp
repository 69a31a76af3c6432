/**
 * @file main.cpp
 * @brief epsim panel sizing command-line entrypoint.
 * @author Watosn
 */

#include <algorithm>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "epsim/analysis/summary.hpp"
#include "epsim/config/config_file.hpp"
#include "epsim/sim/simulation_driver.hpp"

int main(int argc, char** argv) {
  if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    spdlog::info("usage: eps_sizing_cli [config_file|-] [key=value ...]");
    return 0;
  }

  const std::string config_path = (argc >= 2) ? argv[1] : "";
  const std::vector<std::string> overrides(argv + std::min(argc, 2), argv + argc);

  const auto loaded = epsim::config::resolve_config(config_path, overrides);
  if (loaded.status != epsim::core::Status::Ok) {
    spdlog::error("configuration load failed ({}): {}", epsim::core::status_to_string(loaded.status), loaded.message);
    return 2;
  }
  const auto& config = loaded.config;

  spdlog::info("simulating {} orbits of {:.0f} s at dt={} s for {} panel configurations", config.num_orbits,
               config.orbit_period_s, config.time_step_s, config.panel_counts.size());
  const auto result = epsim::sim::run_simulation(config);
  if (result.status != epsim::core::Status::Ok) {
    spdlog::error("invalid configuration: {}", result.message);
    return 3;
  }

  const auto report = epsim::analysis::summarize(result, config);
  if (report.status != epsim::core::Status::Ok) {
    spdlog::error("summary failed: {}", report.message);
    return 4;
  }

  fmt::print("Peak solar power per config [W]:");
  for (const auto& s : report.summaries) {
    fmt::print(" {}p={:.3f}", s.panel_count, s.peak_solar_w);
  }
  fmt::print("\nAverage sunlit power [W]:");
  for (const auto& s : report.summaries) {
    fmt::print(" {}p={:.3f}", s.panel_count, s.avg_sunlit_solar_w);
  }
  fmt::print("\n");

  const std::string rule(60, '=');
  fmt::print("\n{}\nEPS OPTIMIZATION RESULTS\n{}\n", rule, rule);
  for (const auto& s : report.summaries) {
    fmt::print("\n{} Panels:\n", s.panel_count);
    fmt::print("  Min SOC: {:.1f}%\n", 100.0 * s.min_soc);
    fmt::print("  Avg SOC: {:.1f}%\n", 100.0 * s.avg_soc);
    fmt::print("  Final SOC ({} orbits): {:.1f}%\n", config.num_orbits, 100.0 * s.final_soc);
    fmt::print("  Mass: {:.2f} kg\n", s.mass_kg);
    fmt::print("  Transmissions: {} steps, safe mode: {} steps\n", s.tx_count, s.safe_mode_steps);
    fmt::print("  Status: {}\n", s.viable ? "VIABLE" : "FAILS");
  }

  fmt::print("\n{}\n", rule);
  if (report.recommended) {
    const auto& best = report.summaries[*report.recommended];
    fmt::print("RECOMMENDATION: {} panels ({:.2f} kg) keep minimum SOC at {:.1f}% (> {:.1f}%)\n", best.panel_count,
               best.mass_kg, 100.0 * best.min_soc, 100.0 * config.viability_soc);
  } else {
    fmt::print("RECOMMENDATION: no candidate keeps minimum SOC above {:.1f}%\n", 100.0 * config.viability_soc);
  }
  fmt::print("{}\n", rule);

  if (!report.recommended) {
    spdlog::warn("no viable panel configuration");
  }
  return 0;
}
