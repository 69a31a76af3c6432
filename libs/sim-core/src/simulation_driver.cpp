/**
 * @file simulation_driver.cpp
 * @brief Simulation driver implementation.
 * @author Watosn
 */

#include "epsim/sim/simulation_driver.hpp"

#include <utility>

namespace epsim::sim {

SimulationDriver::SimulationDriver(epsim::config::SimulationConfig config)
    : config_(std::move(config)), geometry_(config_), solar_(config_), load_(config_), battery_(config_) {}

ConfigurationStep SimulationDriver::advance(const epsim::config::PanelConfiguration& panels,
                                            const epsim::eps::OrbitalGeometry& geometry,
                                            double effective_capacity_wh,
                                            double previous_soc) const {
  ConfigurationStep out{};
  out.solar = solar_.evaluate(panels, geometry);
  out.load = load_.evaluate(previous_soc, geometry, effective_capacity_wh);
  out.battery = battery_.step(previous_soc, out.solar.power_w, out.load.total_w, effective_capacity_wh);
  return out;
}

SimulationResult SimulationDriver::run() const {
  SimulationResult out{};
  const auto check = epsim::config::validate(config_);
  if (!check.ok()) {
    out.status = check.status;
    out.message = check.message;
    return out;
  }

  out.configurations = epsim::config::make_panel_configurations(config_);
  const auto n_t = static_cast<Eigen::Index>(epsim::config::time_step_count(config_));
  const auto n_p = static_cast<Eigen::Index>(out.configurations.size());

  out.time_s = Eigen::VectorXd::Zero(n_t);
  out.theta_deg = Eigen::VectorXd::Zero(n_t);
  out.eclipsed = FlagVector::Constant(n_t, false);
  out.effective_capacity_wh = Eigen::VectorXd::Zero(n_t);
  out.soc = Eigen::MatrixXd::Zero(n_t, n_p);
  out.solar_power_w = Eigen::MatrixXd::Zero(n_t, n_p);
  out.load_power_w = Eigen::MatrixXd::Zero(n_t, n_p);
  out.net_energy_wh = Eigen::MatrixXd::Zero(n_t, n_p);
  out.tx_active = FlagMatrix::Constant(n_t, n_p, false);
  out.safe_mode = FlagMatrix::Constant(n_t, n_p, false);
  if (n_t == 0) {
    return out;
  }

  for (Eigen::Index t = 0; t < n_t; ++t) {
    out.time_s(t) = static_cast<double>(t) * config_.time_step_s;
  }

  const auto g0 = geometry_.evaluate(out.time_s(0));
  out.theta_deg(0) = g0.theta_deg;
  out.eclipsed(0) = g0.eclipsed;
  out.effective_capacity_wh(0) = battery_.effective_capacity_wh(g0.mission_years);
  out.soc.row(0).setConstant(config_.soc_init);

  for (Eigen::Index t = 1; t < n_t; ++t) {
    const auto geometry = geometry_.evaluate(out.time_s(t));
    const double capacity_wh = battery_.effective_capacity_wh(geometry.mission_years);
    out.theta_deg(t) = geometry.theta_deg;
    out.eclipsed(t) = geometry.eclipsed;
    out.effective_capacity_wh(t) = capacity_wh;

    for (Eigen::Index p = 0; p < n_p; ++p) {
      const auto s = advance(out.configurations[static_cast<std::size_t>(p)], geometry, capacity_wh, out.soc(t - 1, p));
      out.soc(t, p) = s.battery.soc;
      out.solar_power_w(t, p) = s.solar.power_w;
      out.load_power_w(t, p) = s.load.total_w;
      out.net_energy_wh(t, p) = s.battery.net_energy_wh;
      out.tx_active(t, p) = s.load.tx_active;
      out.safe_mode(t, p) = s.load.safe_mode;
    }
  }
  return out;
}

SimulationResult run_simulation(const epsim::config::SimulationConfig& config) {
  return SimulationDriver(config).run();
}

}  // namespace epsim::sim
