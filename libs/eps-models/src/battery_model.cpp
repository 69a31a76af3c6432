/**
 * @file battery_model.cpp
 * @brief Battery model implementation.
 * @author Watosn
 */

#include "epsim/eps/battery_model.hpp"

#include <algorithm>

#include "epsim/core/constants.hpp"

namespace epsim::eps {

namespace constants = epsim::core::constants;

BatteryModel::BatteryModel(const epsim::config::SimulationConfig& config)
    : capacity_wh_(config.battery_capacity_wh),
      fade_rate_per_year_(config.fade_rate_per_year),
      floor_fraction_(config.capacity_floor_fraction),
      charge_efficiency_(config.charge_efficiency),
      dt_s_(config.time_step_s),
      self_discharge_factor_(1.0 - epsim::config::self_discharge_per_day(config) * config.time_step_s /
                                       constants::kSecondsPerDay),
      soc_min_(config.soc_min),
      soc_max_(config.soc_max) {}

double BatteryModel::effective_capacity_wh(double mission_years) const {
  const double faded = capacity_wh_ * (1.0 - fade_rate_per_year_ * mission_years);
  return std::max(faded, floor_fraction_ * capacity_wh_);
}

double BatteryModel::clamp_soc(double soc) const { return std::clamp(soc, soc_min_, soc_max_); }

BatteryStep BatteryModel::step(double previous_soc, double solar_w, double load_w, double effective_capacity_wh) const {
  double de_wh = (solar_w - load_w) * dt_s_ / constants::kSecondsPerHour;
  if (de_wh > 0.0) {
    de_wh *= charge_efficiency_;
  }

  double soc = previous_soc + de_wh / effective_capacity_wh;
  soc *= self_discharge_factor_;

  return BatteryStep{.soc = clamp_soc(soc), .soc_unclamped = soc, .net_energy_wh = de_wh};
}

}  // namespace epsim::eps
