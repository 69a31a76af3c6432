/**
 * @file summary.cpp
 * @brief Sizing summary implementation.
 * @author Watosn
 */

#include "epsim/analysis/summary.hpp"

#include <cmath>

namespace epsim::analysis {

ConfigurationSummary summarize_configuration(const epsim::sim::SimulationResult& result,
                                             std::size_t column,
                                             double viability_soc) {
  if (column >= result.configuration_count() || static_cast<Eigen::Index>(column) >= result.soc.cols() ||
      static_cast<Eigen::Index>(column) >= result.solar_power_w.cols()) {
    return ConfigurationSummary{};
  }
  const auto p = static_cast<Eigen::Index>(column);
  const auto soc = result.soc.col(p);
  const auto solar = result.solar_power_w.col(p).array();
  const auto& panels = result.configurations[column];

  ConfigurationSummary out{};
  out.panel_count = panels.panel_count;
  out.mass_kg = panels.mass_kg;
  if (soc.size() == 0) {
    return out;
  }

  out.min_soc = soc.minCoeff();
  out.avg_soc = soc.mean();
  out.final_soc = soc(soc.size() - 1);
  out.peak_solar_w = solar.maxCoeff();

  const auto lit = (solar > 0.0);
  const auto lit_count = lit.count();
  if (lit_count > 0) {
    out.avg_sunlit_solar_w = lit.select(solar, 0.0).sum() / static_cast<double>(lit_count);
  }
  if (p < result.tx_active.cols()) {
    out.tx_count = static_cast<std::size_t>(result.tx_active.col(p).count());
  }
  if (p < result.safe_mode.cols()) {
    out.safe_mode_steps = static_cast<std::size_t>(result.safe_mode.col(p).count());
  }
  out.viable = out.min_soc > viability_soc;
  return out;
}

SizingReport summarize(const epsim::sim::SimulationResult& result, const epsim::config::SimulationConfig& config) {
  SizingReport out{};
  if (result.status != epsim::core::Status::Ok) {
    out.status = result.status;
    out.message = result.message;
    return out;
  }
  if (result.step_count() == 0) {
    out.status = epsim::core::Status::DataUnavailable;
    out.message = "simulation produced no time steps";
    return out;
  }

  out.summaries.reserve(result.configuration_count());
  for (std::size_t c = 0; c < result.configuration_count(); ++c) {
    out.summaries.push_back(summarize_configuration(result, c, config.viability_soc));
  }
  for (std::size_t c = 0; c < out.summaries.size(); ++c) {
    if (!out.summaries[c].viable) {
      continue;
    }
    if (!out.recommended || out.summaries[c].mass_kg < out.summaries[*out.recommended].mass_kg) {
      out.recommended = c;
    }
  }
  return out;
}

RowWindow last_orbit_window(const epsim::sim::SimulationResult& result, const epsim::config::SimulationConfig& config) {
  const std::size_t n = result.step_count();
  if (!(config.time_step_s > 0.0) || n == 0) {
    return RowWindow{.first = n, .last = n};
  }
  const double per_orbit = std::floor(config.orbit_period_s / config.time_step_s);
  const std::size_t span = (per_orbit > 0.0) ? static_cast<std::size_t>(per_orbit) : 0U;
  return RowWindow{.first = (span >= n) ? 0U : n - span, .last = n};
}

std::optional<std::size_t> find_configuration(const epsim::sim::SimulationResult& result, int panel_count) {
  for (std::size_t c = 0; c < result.configurations.size(); ++c) {
    if (result.configurations[c].panel_count == panel_count) {
      return c;
    }
  }
  return std::nullopt;
}

}  // namespace epsim::analysis
