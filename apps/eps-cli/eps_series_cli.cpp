/**
 * @file eps_series_cli.cpp
 * @brief Full-mission SOC/power time series writer with CSV/JSON outputs.
 * @author Watosn
 */

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "epsim/config/config_file.hpp"
#include "epsim/sim/simulation_driver.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    spdlog::error("usage: eps_series_cli <output_file> <format:csv|json> [config_file|-] [key=value ...]");
    spdlog::error("csv row: time_s,theta_deg,eclipsed,capacity_wh,then soc_<n>p,solar_w_<n>p,load_w_<n>p,tx_<n>p per config");
    return 1;
  }

  const std::filesystem::path output_path = argv[1];
  const std::string format = argv[2];
  const std::string config_path = (argc >= 4) ? argv[3] : "";
  const std::vector<std::string> overrides(argv + std::min(argc, 4), argv + argc);
  if (format != "csv" && format != "json") {
    spdlog::error("format must be csv or json");
    return 4;
  }

  const auto loaded = epsim::config::resolve_config(config_path, overrides);
  if (loaded.status != epsim::core::Status::Ok) {
    spdlog::error("configuration load failed ({}): {}", epsim::core::status_to_string(loaded.status), loaded.message);
    return 2;
  }
  const auto& config = loaded.config;

  const auto r = epsim::sim::run_simulation(config);
  if (r.status != epsim::core::Status::Ok) {
    spdlog::error("invalid configuration: {}", r.message);
    return 5;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  const std::time_t now = std::time(nullptr);
  const auto n_p = static_cast<Eigen::Index>(r.configuration_count());
  std::string counts;
  for (const auto& c : r.configurations) {
    counts += (counts.empty() ? "" : ";") + std::to_string(c.panel_count);
  }

  if (format == "csv") {
    out << fmt::format(
        "#record_type=metadata,schema=eps_series_v1,project=epsim,generated_unix_utc={},dt_s={},orbit_period_s={},"
        "num_orbits={},panel_counts={},config={}\n",
        now, config.time_step_s, config.orbit_period_s, config.num_orbits, counts, config_path);
    out << "time_s,theta_deg,eclipsed,capacity_wh";
    for (const auto& c : r.configurations) {
      out << fmt::format(",soc_{0}p,solar_w_{0}p,load_w_{0}p,tx_{0}p", c.panel_count);
    }
    out << "\n";
  } else {
    out << fmt::format(
        "{{\"record_type\":\"metadata\",\"schema\":\"eps_series_v1\",\"project\":\"epsim\",\"generated_unix_utc\":{},"
        "\"dt_s\":{},\"orbit_period_s\":{},\"num_orbits\":{},\"panel_counts\":[{}],\"config\":\"{}\"}}\n",
        now, config.time_step_s, config.orbit_period_s, config.num_orbits, fmt::join(config.panel_counts, ","),
        config_path);
  }

  for (Eigen::Index t = 0; t < r.time_s.size(); ++t) {
    if (format == "csv") {
      out << fmt::format("{:.1f},{:.6f},{},{:.9f}", r.time_s(t), r.theta_deg(t), r.eclipsed(t) ? 1 : 0,
                         r.effective_capacity_wh(t));
      for (Eigen::Index p = 0; p < n_p; ++p) {
        out << fmt::format(",{:.12e},{:.12e},{:.12e},{}", r.soc(t, p), r.solar_power_w(t, p), r.load_power_w(t, p),
                           r.tx_active(t, p) ? 1 : 0);
      }
      out << "\n";
    } else {
      out << fmt::format(
          "{{\"record_type\":\"sample\",\"schema\":\"eps_series_v1\",\"time_s\":{:.1f},\"theta_deg\":{:.6f},"
          "\"eclipsed\":{},\"capacity_wh\":{:.9f},\"configs\":[",
          r.time_s(t), r.theta_deg(t), r.eclipsed(t) ? "true" : "false", r.effective_capacity_wh(t));
      for (Eigen::Index p = 0; p < n_p; ++p) {
        out << fmt::format("{}{{\"panels\":{},\"soc\":{:.12e},\"solar_w\":{:.12e},\"load_w\":{:.12e},\"tx\":{}}}",
                           (p == 0) ? "" : ",", r.configurations[static_cast<std::size_t>(p)].panel_count,
                           r.soc(t, p), r.solar_power_w(t, p), r.load_power_w(t, p),
                           r.tx_active(t, p) ? "true" : "false");
      }
      out << "]}\n";
    }
  }

  spdlog::info("wrote {} series records: {}", r.step_count(), output_path.string());
  return 0;
}
