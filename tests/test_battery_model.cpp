/**
 * @file test_battery_model.cpp
 * @brief Capacity fade, energy balance and clamping checks.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "epsim/eps/battery_model.hpp"

namespace {

bool near(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace epsim;
  const config::SimulationConfig cfg{};
  const eps::BatteryModel battery(cfg);

  if (!near(battery.effective_capacity_wh(0.0), 10.0) || !near(battery.effective_capacity_wh(1.0), 8.0) ||
      !near(battery.effective_capacity_wh(10.0), 3.0)) {
    spdlog::error("capacity fade mismatch");
    return 1;
  }
  double last = battery.effective_capacity_wh(0.0);
  for (int i = 1; i <= 100; ++i) {
    const double c = battery.effective_capacity_wh(0.1 * i);
    if (c > last || c < 0.3 * cfg.battery_capacity_wh) {
      spdlog::error("capacity fade must be monotonic and floored");
      return 2;
    }
    last = c;
  }

  const double self_discharge = 1.0 - (0.02 / 30.0) * 100.0 / 86400.0;

  const auto discharge = battery.step(0.6, 0.0, 2.5, 10.0);
  if (!near(discharge.net_energy_wh, -2.5 * 100.0 / 3600.0) || !near(discharge.net_energy_wh, -0.0694444, 1e-6)) {
    spdlog::error("discharge energy mismatch: {}", discharge.net_energy_wh);
    return 3;
  }
  if (!near(discharge.soc, (0.6 - 0.25 / 36.0) * self_discharge) || !(0.6 - discharge.soc > 0.00694)) {
    spdlog::error("discharge soc mismatch: {}", discharge.soc);
    return 4;
  }

  const auto charge = battery.step(0.5, 10.0, 2.5, 10.0);
  const double charge_wh = 7.5 * 100.0 / 3600.0 * 0.95;
  if (!near(charge.net_energy_wh, charge_wh) || !near(charge.soc, (0.5 + charge_wh / 10.0) * self_discharge)) {
    spdlog::error("charge derating mismatch: {} {}", charge.net_energy_wh, charge.soc);
    return 5;
  }

  const auto balanced = battery.step(0.5, 2.5, 2.5, 10.0);
  if (!near(balanced.net_energy_wh, 0.0) || !near(balanced.soc, 0.5 * self_discharge)) {
    spdlog::error("self-discharge must apply at zero net power");
    return 6;
  }

  const auto full = battery.step(0.985, 100.0, 0.0, 10.0);
  if (full.soc != cfg.soc_max || !(full.soc_unclamped > cfg.soc_max)) {
    spdlog::error("upper clamp failed: {}", full.soc);
    return 7;
  }
  const auto empty = battery.step(0.21, 0.0, 100.0, 10.0);
  if (empty.soc != cfg.soc_min || !(empty.soc_unclamped < cfg.soc_min)) {
    spdlog::error("lower clamp failed: {}", empty.soc);
    return 8;
  }
  if (battery.clamp_soc(cfg.soc_min) != cfg.soc_min || battery.clamp_soc(cfg.soc_max) != cfg.soc_max) {
    spdlog::error("clamp bounds must be inclusive");
    return 9;
  }

  const auto faded = battery.step(0.6, 0.0, 2.5, battery.effective_capacity_wh(5.0));
  if (!(faded.soc < discharge.soc)) {
    spdlog::error("faded battery should lose more SOC for the same load");
    return 10;
  }

  return 0;
}
