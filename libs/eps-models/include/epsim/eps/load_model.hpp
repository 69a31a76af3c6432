/**
 * @file load_model.hpp
 * @brief Subsystem load model with safe mode and transmission scheduling.
 * @author Watosn
 */
#pragma once

#include "epsim/config/simulation_config.hpp"
#include "epsim/eps/orbital_geometry.hpp"

namespace epsim::eps {

/**
 * @brief Output bundle for load evaluation.
 */
struct BusLoad {
  double baseline_w{};
  double transmission_w{};
  double total_w{};
  bool safe_mode{};
  bool tx_active{};
};

/**
 * @brief Instantaneous bus load for one panel configuration.
 *
 * Below `safe_mode_soc` only the OBC stays powered. A transmission is attempted once
 * per orbit while the orbital angle is inside `[0, window]` and the spacecraft is
 * illuminated; it is granted only if the energy left after the pass, with nominal
 * loads running, stays above the reserve margin.
 */
class LoadModel final {
 public:
  explicit LoadModel(const epsim::config::SimulationConfig& config);

  /**
   * @brief Evaluate bus load.
   * @param previous_soc SOC at the end of the previous step.
   * @param geometry Geometry of the current step.
   * @param effective_capacity_wh Faded battery capacity of the current step.
   */
  [[nodiscard]] BusLoad evaluate(double previous_soc,
                                    const OrbitalGeometry& geometry,
                                    double effective_capacity_wh) const;

  /**
   * @brief Whether the battery can afford a transmission pass from `previous_soc`.
   */
  [[nodiscard]] bool reserve_allows_transmission(double previous_soc, double effective_capacity_wh) const;

  [[nodiscard]] bool in_tx_window(double theta_deg) const { return theta_deg >= 0.0 && theta_deg <= tx_window_deg_; }
  [[nodiscard]] double nominal_w() const { return nominal_w_; }
  [[nodiscard]] double tx_window_deg() const { return tx_window_deg_; }

 private:
  double obc_w_{};
  double nominal_w_{};
  double tx_power_w_{};
  double tx_energy_wh_{};
  double tx_nominal_energy_wh_{};
  double tx_window_deg_{};
  double safe_mode_soc_{};
  double reserve_fraction_{};
};

}  // namespace epsim::eps
