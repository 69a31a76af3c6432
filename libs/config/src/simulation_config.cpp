/**
 * @file simulation_config.cpp
 * @brief Configuration validation and derived quantities.
 * @author Watosn
 */

#include "epsim/config/simulation_config.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "epsim/core/constants.hpp"

namespace epsim::config {
namespace {

ConfigCheck reject(std::string message) {
  return ConfigCheck{.status = epsim::core::Status::InvalidInput, .message = std::move(message)};
}

bool is_fraction(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

bool is_positive(double v) { return std::isfinite(v) && v > 0.0; }

bool is_non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

}  // namespace

ConfigCheck validate(const SimulationConfig& c) {
  if (!is_positive(c.time_step_s)) {
    return reject(fmt::format("time_step_s must be > 0 (got {})", c.time_step_s));
  }
  if (!is_positive(c.orbit_period_s)) {
    return reject(fmt::format("orbit_period_s must be > 0 (got {})", c.orbit_period_s));
  }
  if (c.num_orbits <= 0) {
    return reject(fmt::format("num_orbits must be > 0 (got {})", c.num_orbits));
  }
  const double steps = std::ceil(mission_duration_s(c) / c.time_step_s);
  if (!std::isfinite(steps) || steps > kMaxTimeSteps) {
    return reject(fmt::format("num_orbits * orbit_period_s / time_step_s must not exceed {:.0e} steps (got {} * {} / {})",
                              kMaxTimeSteps, c.num_orbits, c.orbit_period_s, c.time_step_s));
  }
  if (!is_non_negative(c.solar_constant_w_m2)) {
    return reject(fmt::format("solar_constant_w_m2 must be >= 0 (got {})", c.solar_constant_w_m2));
  }
  if (!is_positive(c.panel_area_m2)) {
    return reject(fmt::format("panel_area_m2 must be > 0 (got {})", c.panel_area_m2));
  }
  if (!is_fraction(c.packing_efficiency)) {
    return reject(fmt::format("packing_efficiency must lie in [0, 1] (got {})", c.packing_efficiency));
  }
  if (c.panel_counts.empty()) {
    return reject("panel_counts must list at least one panel count");
  }
  for (std::size_t i = 0; i < c.panel_counts.size(); ++i) {
    if (c.panel_counts[i] <= 0) {
      return reject(fmt::format("panel_counts[{}] must be > 0 (got {})", i, c.panel_counts[i]));
    }
    if (i > 0 && c.panel_counts[i] <= c.panel_counts[i - 1]) {
      return reject(fmt::format("panel_counts must be strictly increasing ({} follows {})", c.panel_counts[i],
                                c.panel_counts[i - 1]));
    }
  }

  const struct {
    const char* name;
    double value;
  } efficiencies[] = {
      {"cell_efficiency", c.cell_efficiency},
      {"mppt_efficiency", c.mppt_efficiency},
      {"wiring_efficiency", c.wiring_efficiency},
  };
  for (const auto& e : efficiencies) {
    if (!is_fraction(e.value)) {
      return reject(fmt::format("{} must lie in [0, 1] (got {})", e.name, e.value));
    }
  }

  const struct {
    const char* name;
    double value;
  } powers[] = {
      {"obc_power_w", c.obc_power_w},
      {"adcs_power_w", c.adcs_power_w},
      {"comms_power_w", c.comms_power_w},
      {"payload_power_w", c.payload_power_w},
      {"tx_power_w", c.tx_power_w},
  };
  for (const auto& p : powers) {
    if (!is_non_negative(p.value)) {
      return reject(fmt::format("{} must be >= 0 (got {})", p.name, p.value));
    }
  }

  if (!is_non_negative(c.tx_duration_s) || c.tx_duration_s > c.orbit_period_s) {
    return reject(fmt::format("tx_duration_s must lie in [0, orbit_period_s] (got {})", c.tx_duration_s));
  }
  if (!is_positive(c.battery_capacity_wh)) {
    return reject(fmt::format("battery_capacity_wh must be > 0 (got {})", c.battery_capacity_wh));
  }
  if (!is_fraction(c.soc_min) || !is_fraction(c.soc_max)) {
    return reject(fmt::format("soc_min and soc_max must lie in [0, 1] (got {}, {})", c.soc_min, c.soc_max));
  }
  if (c.soc_min >= c.soc_max) {
    return reject(fmt::format("soc_min must be < soc_max (got {} >= {})", c.soc_min, c.soc_max));
  }
  if (!std::isfinite(c.soc_init) || c.soc_init < c.soc_min || c.soc_init > c.soc_max) {
    return reject(fmt::format("soc_init must lie in [soc_min, soc_max] (got {})", c.soc_init));
  }
  if (!is_non_negative(c.fade_rate_per_year)) {
    return reject(fmt::format("fade_rate_per_year must be >= 0 (got {})", c.fade_rate_per_year));
  }
  if (!is_fraction(c.self_discharge_per_month)) {
    return reject(fmt::format("self_discharge_per_month must lie in [0, 1] (got {})", c.self_discharge_per_month));
  }
  if (!is_positive(c.charge_efficiency) || c.charge_efficiency > 1.0) {
    return reject(fmt::format("charge_efficiency must lie in (0, 1] (got {})", c.charge_efficiency));
  }
  if (!is_positive(c.capacity_floor_fraction) || c.capacity_floor_fraction > 1.0) {
    return reject(fmt::format("capacity_floor_fraction must lie in (0, 1] (got {})", c.capacity_floor_fraction));
  }
  if (!is_fraction(c.safe_mode_soc)) {
    return reject(fmt::format("safe_mode_soc must lie in [0, 1] (got {})", c.safe_mode_soc));
  }
  if (!is_fraction(c.tx_reserve_fraction)) {
    return reject(fmt::format("tx_reserve_fraction must lie in [0, 1] (got {})", c.tx_reserve_fraction));
  }
  if (!is_fraction(c.viability_soc)) {
    return reject(fmt::format("viability_soc must lie in [0, 1] (got {})", c.viability_soc));
  }
  if (!is_non_negative(c.panel_mass_kg)) {
    return reject(fmt::format("panel_mass_kg must be >= 0 (got {})", c.panel_mass_kg));
  }
  return ConfigCheck{};
}

PanelConfiguration make_panel_configuration(const SimulationConfig& config, int panel_count) {
  const double area = static_cast<double>(panel_count) * config.panel_area_m2 * config.packing_efficiency;
  return PanelConfiguration{
      .panel_count = panel_count,
      .total_area_m2 = area,
      .peak_power_w = config.solar_constant_w_m2 * area,
      .mass_kg = static_cast<double>(panel_count) * config.panel_mass_kg,
  };
}

std::vector<PanelConfiguration> make_panel_configurations(const SimulationConfig& config) {
  std::vector<PanelConfiguration> out;
  out.reserve(config.panel_counts.size());
  for (const int n : config.panel_counts) {
    out.push_back(make_panel_configuration(config, n));
  }
  return out;
}

double mission_duration_s(const SimulationConfig& config) {
  return static_cast<double>(config.num_orbits) * config.orbit_period_s;
}

double nominal_load_w(const SimulationConfig& config) {
  return config.obc_power_w + config.adcs_power_w + config.comms_power_w + config.payload_power_w;
}

double self_discharge_per_day(const SimulationConfig& config) {
  return config.self_discharge_per_month / epsim::core::constants::kDaysPerMonth;
}

double tx_window_width_deg(const SimulationConfig& config) {
  return epsim::core::constants::kFullCircleDeg * config.tx_duration_s / config.orbit_period_s;
}

std::size_t time_step_count(const SimulationConfig& config) {
  if (!(config.time_step_s > 0.0)) {
    return 0U;
  }
  const double n = std::ceil(mission_duration_s(config) / config.time_step_s);
  if (!std::isfinite(n) || !(n > 0.0) || n > kMaxTimeSteps) {
    return 0U;
  }
  return static_cast<std::size_t>(n);
}

}  // namespace epsim::config
