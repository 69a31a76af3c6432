/**
 * @file simulation_config.hpp
 * @brief Immutable EPS simulation configuration and panel configurations.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "epsim/core/types.hpp"

namespace epsim::config {

/**
 * @brief Largest time grid a run may request (`num_orbits * orbit_period_s / time_step_s`).
 */
inline constexpr double kMaxTimeSteps = 1.0e8;

/**
 * @brief Full parameter set for one sizing run.
 *
 * Defaults reproduce the reference 1U-class scenario: 95 min orbit, 100 orbits,
 * 10 Wh battery and one to six 10x10 cm panels.
 */
struct SimulationConfig {
  // Time grid
  double time_step_s{100.0};
  double orbit_period_s{95.0 * 60.0};
  int num_orbits{100};

  // Solar array
  double solar_constant_w_m2{1361.0};
  double panel_area_m2{0.1 * 0.1};
  double packing_efficiency{0.5};
  std::vector<int> panel_counts{1, 2, 3, 4, 5, 6};
  double cell_efficiency{0.30};
  double mppt_efficiency{0.95};
  double wiring_efficiency{0.97};

  // Subsystem loads
  double obc_power_w{0.5};
  double adcs_power_w{0.8};
  double comms_power_w{0.7};
  double payload_power_w{0.5};

  // Transmission
  double tx_power_w{15.0};
  double tx_duration_s{15.0 * 60.0};

  // Battery
  double battery_capacity_wh{10.0};
  double soc_min{0.2};
  double soc_max{0.99};
  double soc_init{0.6};
  double fade_rate_per_year{0.20};
  double self_discharge_per_month{0.02};
  double charge_efficiency{0.95};
  double capacity_floor_fraction{0.30};

  // Operations policy
  double safe_mode_soc{0.30};
  double tx_reserve_fraction{0.30};
  double viability_soc{0.25};
  double panel_mass_kg{0.05};
};

/**
 * @brief One candidate panel count with its derived array properties.
 */
struct PanelConfiguration {
  int panel_count{};
  double total_area_m2{};
  double peak_power_w{};
  double mass_kg{};
};

/**
 * @brief Outcome of configuration validation.
 */
struct ConfigCheck {
  epsim::core::Status status{epsim::core::Status::Ok};
  std::string message{};

  [[nodiscard]] bool ok() const { return status == epsim::core::Status::Ok; }
};

/**
 * @brief Reject configurations the simulation cannot run on.
 * @return `Ok`, or `InvalidInput` with a message naming the first offending field.
 */
[[nodiscard]] ConfigCheck validate(const SimulationConfig& config);

/**
 * @brief Derive the array properties for one panel count.
 */
[[nodiscard]] PanelConfiguration make_panel_configuration(const SimulationConfig& config, int panel_count);

/**
 * @brief Derive all panel configurations in the configured order.
 */
[[nodiscard]] std::vector<PanelConfiguration> make_panel_configurations(const SimulationConfig& config);

[[nodiscard]] double mission_duration_s(const SimulationConfig& config);
[[nodiscard]] double nominal_load_w(const SimulationConfig& config);
[[nodiscard]] double self_discharge_per_day(const SimulationConfig& config);

/**
 * @brief Orbital angle span of the transmission window, in degrees.
 */
[[nodiscard]] double tx_window_width_deg(const SimulationConfig& config);

/**
 * @brief Number of samples in the time grid `[0, duration)` with step `time_step_s`.
 * @return 0 when the step is not positive or the grid exceeds `kMaxTimeSteps`.
 */
[[nodiscard]] std::size_t time_step_count(const SimulationConfig& config);

}  // namespace epsim::config
