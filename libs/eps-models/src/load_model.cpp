/**
 * @file load_model.cpp
 * @brief Subsystem load model implementation.
 * @author Watosn
 */

#include "epsim/eps/load_model.hpp"

#include "epsim/core/constants.hpp"

namespace epsim::eps {

LoadModel::LoadModel(const epsim::config::SimulationConfig& config)
    : obc_w_(config.obc_power_w),
      nominal_w_(epsim::config::nominal_load_w(config)),
      tx_power_w_(config.tx_power_w),
      tx_energy_wh_(config.tx_power_w * config.tx_duration_s / epsim::core::constants::kSecondsPerHour),
      tx_nominal_energy_wh_(nominal_w_ * config.tx_duration_s / epsim::core::constants::kSecondsPerHour),
      tx_window_deg_(epsim::config::tx_window_width_deg(config)),
      safe_mode_soc_(config.safe_mode_soc),
      reserve_fraction_(config.tx_reserve_fraction) {}

bool LoadModel::reserve_allows_transmission(double previous_soc, double effective_capacity_wh) const {
  const double available_wh = previous_soc * effective_capacity_wh;
  const double reserve_wh = reserve_fraction_ * effective_capacity_wh;
  return available_wh - tx_nominal_energy_wh_ > reserve_wh + tx_energy_wh_;
}

BusLoad LoadModel::evaluate(double previous_soc, const OrbitalGeometry& geometry, double effective_capacity_wh) const {
  BusLoad out{};
  out.safe_mode = previous_soc < safe_mode_soc_;
  out.baseline_w = out.safe_mode ? obc_w_ : nominal_w_;

  out.tx_active = geometry.illumination == 1.0 && in_tx_window(geometry.theta_deg) &&
                  reserve_allows_transmission(previous_soc, effective_capacity_wh);
  out.transmission_w = out.tx_active ? tx_power_w_ : 0.0;
  out.total_w = out.baseline_w + out.transmission_w;
  return out;
}

}  // namespace epsim::eps
