/**
 * @file summary.hpp
 * @brief Per-configuration sizing summaries and recommendation.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "epsim/config/simulation_config.hpp"
#include "epsim/core/types.hpp"
#include "epsim/sim/simulation_driver.hpp"

namespace epsim::analysis {

/**
 * @brief Scalar figures of merit for one panel configuration.
 */
struct ConfigurationSummary {
  int panel_count{};
  double min_soc{};
  double avg_soc{};
  double final_soc{};
  double mass_kg{};
  double peak_solar_w{};
  /// Mean generated power over steps with positive generation; 0 if never lit.
  double avg_sunlit_solar_w{};
  std::size_t tx_count{};
  std::size_t safe_mode_steps{};
  bool viable{};
};

/**
 * @brief Summaries for all configurations plus the lightest viable choice.
 */
struct SizingReport {
  std::vector<ConfigurationSummary> summaries{};
  /// Index into `summaries` of the lightest viable configuration, if any.
  std::optional<std::size_t> recommended{};
  epsim::core::Status status{epsim::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Contiguous row range `[first, last)` of the result series.
 */
struct RowWindow {
  std::size_t first{};
  std::size_t last{};

  [[nodiscard]] std::size_t size() const { return last - first; }
};

/**
 * @brief Summarize one configuration column of a result.
 * @param viability_soc Viable iff the minimum SOC is strictly above this.
 * @return Default (empty, non-viable) summary when `column` is out of range.
 */
[[nodiscard]] ConfigurationSummary summarize_configuration(const epsim::sim::SimulationResult& result,
                                                           std::size_t column,
                                                           double viability_soc);

/**
 * @brief Summarize every configuration and pick the lightest viable one.
 */
[[nodiscard]] SizingReport summarize(const epsim::sim::SimulationResult& result,
                                     const epsim::config::SimulationConfig& config);

/**
 * @brief Rows covering the final orbit (`floor(orbit_period / dt)` steps, clipped).
 */
[[nodiscard]] RowWindow last_orbit_window(const epsim::sim::SimulationResult& result,
                                          const epsim::config::SimulationConfig& config);

/**
 * @brief Column of a panel count in the result, if present.
 */
[[nodiscard]] std::optional<std::size_t> find_configuration(const epsim::sim::SimulationResult& result, int panel_count);

}  // namespace epsim::analysis
