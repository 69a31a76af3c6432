/**
 * @file test_summary.cpp
 * @brief Sizing summary, viability and orbit window checks.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "epsim/analysis/summary.hpp"

namespace {

bool near(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

epsim::sim::SimulationResult make_result() {
  using epsim::sim::FlagMatrix;
  const epsim::config::SimulationConfig cfg{};
  epsim::sim::SimulationResult r{};
  r.configurations = {epsim::config::make_panel_configuration(cfg, 1), epsim::config::make_panel_configuration(cfg, 2),
                      epsim::config::make_panel_configuration(cfg, 3)};
  r.time_s = Eigen::VectorXd::LinSpaced(4, 0.0, 300.0);
  r.soc.resize(4, 3);
  r.soc << 0.6, 0.6, 0.6,
           0.4, 0.5, 0.7,
           0.25, 0.3, 0.8,
           0.3, 0.4, 0.9;
  r.solar_power_w.resize(4, 3);
  r.solar_power_w << 0.0, 0.0, 0.0,
                     1.0, 2.0, 3.0,
                     0.0, 0.0, 0.0,
                     3.0, 4.0, 5.0;
  r.load_power_w = Eigen::MatrixXd::Constant(4, 3, 2.5);
  r.tx_active = FlagMatrix::Constant(4, 3, false);
  r.tx_active(3, 2) = true;
  r.safe_mode = FlagMatrix::Constant(4, 3, false);
  r.safe_mode(2, 0) = true;
  r.safe_mode(3, 0) = true;
  return r;
}

}  // namespace

int main() {
  using namespace epsim;
  const config::SimulationConfig cfg{};
  const auto r = make_result();

  const auto one = analysis::summarize_configuration(r, 0, cfg.viability_soc);
  if (one.panel_count != 1 || !near(one.min_soc, 0.25) || !near(one.avg_soc, 1.55 / 4.0) || !near(one.final_soc, 0.3) ||
      !near(one.mass_kg, 0.05) || one.safe_mode_steps != 2U) {
    spdlog::error("1-panel summary mismatch");
    return 1;
  }
  if (one.viable) {
    spdlog::error("min SOC equal to the threshold must not be viable");
    return 2;
  }
  if (!near(one.peak_solar_w, 3.0) || !near(one.avg_sunlit_solar_w, 2.0)) {
    spdlog::error("solar sanity metrics mismatch: {} {}", one.peak_solar_w, one.avg_sunlit_solar_w);
    return 3;
  }

  const auto report = analysis::summarize(r, cfg);
  if (report.status != core::Status::Ok || report.summaries.size() != 3U) {
    spdlog::error("summarize failed");
    return 4;
  }
  if (!report.summaries[1].viable || !report.summaries[2].viable || report.summaries[2].tx_count != 1U) {
    spdlog::error("viability classification mismatch");
    return 5;
  }
  if (!report.recommended || *report.recommended != 1U) {
    spdlog::error("lightest viable configuration should be recommended");
    return 6;
  }

  auto dark = r;
  dark.solar_power_w.setZero();
  const auto unlit = analysis::summarize_configuration(dark, 2, cfg.viability_soc);
  if (unlit.avg_sunlit_solar_w != 0.0 || unlit.peak_solar_w != 0.0) {
    spdlog::error("never-lit configuration must report zero sunlit power");
    return 7;
  }

  auto failing = r;
  failing.soc.setConstant(0.2);
  const auto none = analysis::summarize(failing, cfg);
  if (none.status != core::Status::Ok || none.recommended.has_value()) {
    spdlog::error("no recommendation expected when nothing is viable");
    return 8;
  }

  sim::SimulationResult invalid{};
  invalid.status = core::Status::InvalidInput;
  invalid.message = "soc_min must be < soc_max";
  const auto propagated = analysis::summarize(invalid, cfg);
  if (propagated.status != core::Status::InvalidInput || propagated.message != invalid.message) {
    spdlog::error("invalid result status must propagate");
    return 9;
  }

  const auto missing = analysis::summarize_configuration(r, 3, cfg.viability_soc);
  if (missing.panel_count != 0 || missing.viable || missing.tx_count != 0U || missing.min_soc != 0.0) {
    spdlog::error("out-of-range column must give an empty summary");
    return 13;
  }

  const auto found = analysis::find_configuration(r, 3);
  if (!found || *found != 2U || analysis::find_configuration(r, 7).has_value()) {
    spdlog::error("configuration lookup mismatch");
    return 10;
  }

  sim::SimulationResult long_run{};
  long_run.time_s = Eigen::VectorXd::Zero(5700);
  const auto window = analysis::last_orbit_window(long_run, cfg);
  if (window.first != 5643U || window.last != 5700U || window.size() != 57U) {
    spdlog::error("last orbit window mismatch: [{}, {})", window.first, window.last);
    return 11;
  }
  const auto short_window = analysis::last_orbit_window(r, cfg);
  if (short_window.first != 0U || short_window.last != 4U) {
    spdlog::error("orbit window must clip to the available rows");
    return 12;
  }

  return 0;
}
