/**
 * @file eps_orbit_cli.cpp
 * @brief Last-orbit power and SOC detail for one panel configuration.
 * @author Watosn
 */

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "epsim/analysis/summary.hpp"
#include "epsim/config/config_file.hpp"
#include "epsim/sim/simulation_driver.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    spdlog::error("usage: eps_orbit_cli <output_csv> [panel_count] [config_file|-] [key=value ...]");
    return 1;
  }

  const std::filesystem::path output_csv = argv[1];
  const int panel_count = (argc >= 3) ? std::atoi(argv[2]) : 4;
  const std::string config_path = (argc >= 4) ? argv[3] : "";
  const std::vector<std::string> overrides(argv + std::min(argc, 4), argv + argc);

  const auto loaded = epsim::config::resolve_config(config_path, overrides);
  if (loaded.status != epsim::core::Status::Ok) {
    spdlog::error("configuration load failed ({}): {}", epsim::core::status_to_string(loaded.status), loaded.message);
    return 2;
  }
  const auto& config = loaded.config;

  const auto r = epsim::sim::run_simulation(config);
  if (r.status != epsim::core::Status::Ok) {
    spdlog::error("invalid configuration: {}", r.message);
    return 3;
  }
  const auto column = epsim::analysis::find_configuration(r, panel_count);
  if (!column) {
    spdlog::error("panel count {} is not among the configured candidates", panel_count);
    return 4;
  }

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 5;
  }

  const auto p = static_cast<Eigen::Index>(*column);
  const auto window = epsim::analysis::last_orbit_window(r, config);
  out << "time_s,theta_deg,eclipsed,solar_w,load_w,net_power_w,soc,tx,safe_mode\n";
  for (std::size_t i = window.first; i < window.last; ++i) {
    const auto t = static_cast<Eigen::Index>(i);
    out << fmt::format("{:.1f},{:.6f},{},{:.12e},{:.12e},{:.12e},{:.12e},{},{}\n", r.time_s(t), r.theta_deg(t),
                       r.eclipsed(t) ? 1 : 0, r.solar_power_w(t, p), r.load_power_w(t, p),
                       r.solar_power_w(t, p) - r.load_power_w(t, p), r.soc(t, p), r.tx_active(t, p) ? 1 : 0,
                       r.safe_mode(t, p) ? 1 : 0);
  }

  spdlog::info("wrote last-orbit detail ({} rows, {} panels): {}", window.size(), panel_count, output_csv.string());
  return 0;
}
