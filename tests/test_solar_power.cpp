/**
 * @file test_solar_power.cpp
 * @brief Solar array output checks.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "epsim/core/constants.hpp"
#include "epsim/eps/orbital_geometry.hpp"
#include "epsim/eps/solar_power.hpp"

namespace {

bool approx(double a, double b, double rel = 1e-12) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace epsim;
  const config::SimulationConfig cfg{};
  const eps::OrbitalGeometryModel geometry(cfg);
  const eps::SolarPowerModel solar(cfg);

  const auto four = config::make_panel_configuration(cfg, 4);
  if (!approx(four.total_area_m2, 0.02) || !approx(four.peak_power_w, 27.22)) {
    spdlog::error("4-panel derived area/peak mismatch: {} {}", four.total_area_m2, four.peak_power_w);
    return 1;
  }

  const auto g0 = geometry.evaluate(0.0);
  const auto p0 = solar.evaluate(four, g0);
  const double expected = 27.22 * 0.30 * 0.95 * 0.97 * (0.6 + 0.4 * std::cos(-core::constants::kPi / 4.0));
  if (!approx(p0.power_w, expected, 1e-12)) {
    spdlog::error("t=0 4-panel power mismatch: {} vs {}", p0.power_w, expected);
    return 2;
  }
  if (!(p0.power_w > 6.55 && p0.power_w < 6.70)) {
    spdlog::error("t=0 4-panel power out of expected band: {}", p0.power_w);
    return 3;
  }

  const auto ge = geometry.evaluate(2000.0);
  if (!ge.eclipsed || solar.evaluate(four, ge).power_w != 0.0) {
    spdlog::error("eclipsed power must be exactly zero");
    return 4;
  }

  eps::OrbitalGeometry no_projection = g0;
  no_projection.projection_factor = 0.0;
  if (solar.evaluate(four, no_projection).power_w != 0.0) {
    spdlog::error("zero projection must give zero power");
    return 5;
  }

  const auto eight = config::make_panel_configuration(cfg, 8);
  if (!approx(solar.evaluate(eight, g0).power_w, 2.0 * p0.power_w)) {
    spdlog::error("power should scale linearly with panel count");
    return 6;
  }

  config::SimulationConfig dead = cfg;
  dead.cell_efficiency = 0.0;
  const eps::SolarPowerModel dead_solar(dead);
  if (dead_solar.evaluate(four, g0).power_w != 0.0 || dead_solar.chain_efficiency() != 0.0) {
    spdlog::error("zero cell efficiency must give zero power");
    return 7;
  }

  for (int k = 0; k < 57; ++k) {
    const auto g = geometry.evaluate(100.0 * k);
    if (solar.evaluate(four, g).power_w < 0.0) {
      spdlog::error("negative power at step {}", k);
      return 8;
    }
  }

  return 0;
}
