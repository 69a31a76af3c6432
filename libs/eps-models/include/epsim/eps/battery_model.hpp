/**
 * @file battery_model.hpp
 * @brief Battery state-of-charge integrator with fade and self-discharge.
 * @author Watosn
 */
#pragma once

#include "epsim/config/simulation_config.hpp"

namespace epsim::eps {

/**
 * @brief Result of one battery integration step.
 */
struct BatteryStep {
  double soc{};
  /// SOC after self-discharge, before clamping to the configured bounds.
  double soc_unclamped{};
  /// Net energy into the battery over the step after charge derating [Wh].
  double net_energy_wh{};
};

/**
 * @brief Energy-balance battery model.
 */
class BatteryModel final {
 public:
  explicit BatteryModel(const epsim::config::SimulationConfig& config);

  /**
   * @brief Faded capacity `C * (1 - fade * years)`, floored at `floor * C`.
   */
  [[nodiscard]] double effective_capacity_wh(double mission_years) const;

  /**
   * @brief Integrate one step of net power into SOC.
   *
   * Charging energy is derated by the charge efficiency, self-discharge is applied
   * every step, and the result saturates at `[soc_min, soc_max]`.
   */
  [[nodiscard]] BatteryStep step(double previous_soc, double solar_w, double load_w, double effective_capacity_wh) const;

  [[nodiscard]] double clamp_soc(double soc) const;

 private:
  double capacity_wh_{};
  double fade_rate_per_year_{};
  double floor_fraction_{};
  double charge_efficiency_{};
  double dt_s_{};
  double self_discharge_factor_{};
  double soc_min_{};
  double soc_max_{};
};

}  // namespace epsim::eps
