/**
 * @file simulation_driver.hpp
 * @brief Multi-orbit EPS energy-balance simulation over candidate panel counts.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "epsim/config/simulation_config.hpp"
#include "epsim/core/types.hpp"
#include "epsim/eps/battery_model.hpp"
#include "epsim/eps/load_model.hpp"
#include "epsim/eps/orbital_geometry.hpp"
#include "epsim/eps/solar_power.hpp"

namespace epsim::sim {

using FlagMatrix = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;
using FlagVector = Eigen::Array<bool, Eigen::Dynamic, 1>;

/**
 * @brief Time series produced by one run.
 *
 * Matrices are indexed `(time_index, configuration_index)`; configuration columns
 * follow `configurations`. Row 0 holds the initial state with zero energy records.
 */
struct SimulationResult {
  std::vector<epsim::config::PanelConfiguration> configurations{};
  Eigen::VectorXd time_s{};
  Eigen::VectorXd theta_deg{};
  FlagVector eclipsed{};
  Eigen::VectorXd effective_capacity_wh{};
  Eigen::MatrixXd soc{};
  Eigen::MatrixXd solar_power_w{};
  Eigen::MatrixXd load_power_w{};
  Eigen::MatrixXd net_energy_wh{};
  FlagMatrix tx_active{};
  FlagMatrix safe_mode{};
  epsim::core::Status status{epsim::core::Status::Ok};
  std::string message{};

  [[nodiscard]] std::size_t step_count() const { return static_cast<std::size_t>(time_s.size()); }
  [[nodiscard]] std::size_t configuration_count() const { return configurations.size(); }
};

/**
 * @brief Energy balance of one configuration over one step.
 */
struct ConfigurationStep {
  epsim::eps::SolarPowerResult solar{};
  epsim::eps::BusLoad load{};
  epsim::eps::BatteryStep battery{};
};

/**
 * @brief Advances all panel configurations jointly across the time grid.
 *
 * The time axis is a strict fold (step t reads only row t-1); within a step each
 * configuration is updated independently from shared geometry and capacity.
 */
class SimulationDriver final {
 public:
  explicit SimulationDriver(epsim::config::SimulationConfig config);

  /**
   * @brief Validate the configuration and run the full mission.
   * @return Filled result, or `InvalidInput` with a message and empty series.
   */
  [[nodiscard]] SimulationResult run() const;

  /**
   * @brief Advance one configuration by one step: Solar -> Load -> Battery.
   */
  [[nodiscard]] ConfigurationStep advance(const epsim::config::PanelConfiguration& panels,
                                          const epsim::eps::OrbitalGeometry& geometry,
                                          double effective_capacity_wh,
                                          double previous_soc) const;

  [[nodiscard]] const epsim::config::SimulationConfig& config() const { return config_; }
  [[nodiscard]] const epsim::eps::OrbitalGeometryModel& geometry_model() const { return geometry_; }
  [[nodiscard]] const epsim::eps::BatteryModel& battery_model() const { return battery_; }

 private:
  epsim::config::SimulationConfig config_{};
  epsim::eps::OrbitalGeometryModel geometry_;
  epsim::eps::SolarPowerModel solar_;
  epsim::eps::LoadModel load_;
  epsim::eps::BatteryModel battery_;
};

/**
 * @brief Convenience wrapper: construct a driver and run it.
 */
[[nodiscard]] SimulationResult run_simulation(const epsim::config::SimulationConfig& config);

}  // namespace epsim::sim
