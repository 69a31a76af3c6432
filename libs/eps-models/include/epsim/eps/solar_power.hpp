/**
 * @file solar_power.hpp
 * @brief Solar array electrical output model.
 * @author Watosn
 */
#pragma once

#include "epsim/config/simulation_config.hpp"
#include "epsim/eps/orbital_geometry.hpp"

namespace epsim::eps {

/**
 * @brief Output bundle for solar array evaluation.
 */
struct SolarPowerResult {
  double power_w{};
  /// Power before projection and illumination derating.
  double conditioned_peak_w{};
};

/**
 * @brief Converts orbit geometry into generated array power for one panel configuration.
 *
 * `P = G * A * eta_cell * eta_mppt * eta_wiring * f * illumination`.
 */
class SolarPowerModel final {
 public:
  explicit SolarPowerModel(const epsim::config::SimulationConfig& config)
      : chain_efficiency_(config.cell_efficiency * config.mppt_efficiency * config.wiring_efficiency) {}

  [[nodiscard]] SolarPowerResult evaluate(const epsim::config::PanelConfiguration& panels,
                                          const OrbitalGeometry& geometry) const;

  /**
   * @brief Product of cell, MPPT and wiring efficiencies.
   */
  [[nodiscard]] double chain_efficiency() const { return chain_efficiency_; }

 private:
  double chain_efficiency_{};
};

}  // namespace epsim::eps
