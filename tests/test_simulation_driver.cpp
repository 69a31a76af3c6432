/**
 * @file test_simulation_driver.cpp
 * @brief Multi-orbit driver invariants and determinism checks.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "epsim/config/simulation_config.hpp"
#include "epsim/sim/simulation_driver.hpp"

namespace {

bool same_series(const epsim::sim::SimulationResult& a, const epsim::sim::SimulationResult& b) {
  return a.soc.rows() == b.soc.rows() && a.soc.cols() == b.soc.cols() && (a.soc.array() == b.soc.array()).all() &&
         (a.solar_power_w.array() == b.solar_power_w.array()).all() &&
         (a.load_power_w.array() == b.load_power_w.array()).all() && (a.time_s.array() == b.time_s.array()).all() &&
         (a.tx_active == b.tx_active).all();
}

}  // namespace

int main() {
  using namespace epsim;
  const config::SimulationConfig cfg{};
  const sim::SimulationDriver driver(cfg);
  const auto r = driver.run();
  if (r.status != core::Status::Ok) {
    spdlog::error("default run failed: {}", r.message);
    return 1;
  }

  const Eigen::Index n_t = 5700;
  const Eigen::Index n_p = 6;
  if (r.time_s.size() != n_t || r.soc.rows() != n_t || r.soc.cols() != n_p || r.configuration_count() != 6U ||
      r.load_power_w.cols() != n_p || r.tx_active.rows() != n_t) {
    spdlog::error("unexpected series shape {}x{}", r.soc.rows(), r.soc.cols());
    return 2;
  }
  if (r.time_s(0) != 0.0 || r.time_s(n_t - 1) != 569900.0) {
    spdlog::error("time grid must be [0, duration) with step dt");
    return 3;
  }
  if (!(r.soc.row(0).array() == cfg.soc_init).all()) {
    spdlog::error("row 0 must hold the initial SOC");
    return 4;
  }

  if (r.soc.minCoeff() < cfg.soc_min || r.soc.maxCoeff() > cfg.soc_max) {
    spdlog::error("clamp invariant violated: [{}, {}]", r.soc.minCoeff(), r.soc.maxCoeff());
    return 5;
  }

  const double window_deg = config::tx_window_width_deg(cfg);
  for (Eigen::Index t = 0; t < n_t; ++t) {
    const double theta = r.theta_deg(t);
    const bool dark = theta > 120.0 && theta < 270.0;
    if (dark != r.eclipsed(t)) {
      spdlog::error("eclipse flag mismatch at step {}", t);
      return 6;
    }
    for (Eigen::Index p = 0; p < n_p; ++p) {
      if (dark && r.solar_power_w(t, p) != 0.0) {
        spdlog::error("eclipse invariant violated at step {} config {}", t, p);
        return 7;
      }
      if (r.tx_active(t, p) && (dark || theta > window_deg)) {
        spdlog::error("transmission outside an illuminated window at step {}", t);
        return 8;
      }
    }
  }
  if (r.tx_active.count() == 0) {
    spdlog::error("expected at least one granted transmission in the default scenario");
    return 9;
  }

  // Each row is a fold of the previous one.
  for (const Eigen::Index t : {Eigen::Index{1}, Eigen::Index{57}, Eigen::Index{2500}, n_t - 1}) {
    const auto g = driver.geometry_model().evaluate(r.time_s(t));
    const double cap = driver.battery_model().effective_capacity_wh(g.mission_years);
    for (Eigen::Index p = 0; p < n_p; ++p) {
      const auto s = driver.advance(r.configurations[static_cast<std::size_t>(p)], g, cap, r.soc(t - 1, p));
      if (s.battery.soc != r.soc(t, p) || s.load.total_w != r.load_power_w(t, p) ||
          s.solar.power_w != r.solar_power_w(t, p) || cap != r.effective_capacity_wh(t)) {
        spdlog::error("row {} is not the fold of row {} for config {}", t, t - 1, p);
        return 10;
      }
    }
  }

  const auto again = sim::run_simulation(cfg);
  if (!same_series(r, again)) {
    spdlog::error("repeated runs must be bit-identical");
    return 11;
  }

  config::SimulationConfig locked = cfg;
  locked.tx_reserve_fraction = 1.0;
  const auto no_tx = sim::run_simulation(locked);
  if (no_tx.status != core::Status::Ok || no_tx.tx_active.count() != 0) {
    spdlog::error("reserve equal to capacity must disable transmissions");
    return 12;
  }

  // Configurations are independent: a single-column run reproduces its column of the full run.
  config::SimulationConfig only_three = cfg;
  only_three.panel_counts = {3};
  const auto single = sim::run_simulation(only_three);
  if (single.status != core::Status::Ok || !(single.soc.col(0).array() == r.soc.col(2).array()).all() ||
      !(single.load_power_w.col(0).array() == r.load_power_w.col(2).array()).all()) {
    spdlog::error("configuration columns must not depend on each other");
    return 13;
  }

  config::SimulationConfig bad = cfg;
  bad.soc_min = 0.9;
  bad.soc_max = 0.5;
  const auto rejected = sim::run_simulation(bad);
  if (rejected.status != core::Status::InvalidInput || rejected.message.empty() || rejected.step_count() != 0U) {
    spdlog::error("invalid configuration must be rejected before simulating");
    return 14;
  }

  config::SimulationConfig empty = cfg;
  empty.panel_counts.clear();
  if (sim::run_simulation(empty).status != core::Status::InvalidInput) {
    spdlog::error("empty panel list must be rejected");
    return 15;
  }

  config::SimulationConfig odd_step = cfg;
  odd_step.num_orbits = 1;
  odd_step.time_step_s = 1000.0;
  const auto coarse = sim::run_simulation(odd_step);
  if (coarse.step_count() != 6U || coarse.time_s(5) != 5000.0) {
    spdlog::error("non-dividing step must keep the exclusive end, got {} steps", coarse.step_count());
    return 16;
  }

  config::SimulationConfig runaway = cfg;
  runaway.time_step_s = 1e-300;
  const auto refused = sim::run_simulation(runaway);
  if (refused.status != core::Status::InvalidInput || refused.step_count() != 0U) {
    spdlog::error("run with an oversized time grid must be refused before allocating");
    return 17;
  }

  return 0;
}
