/**
 * @file solar_power.cpp
 * @brief Solar array output implementation.
 * @author Watosn
 */

#include "epsim/eps/solar_power.hpp"

namespace epsim::eps {

SolarPowerResult SolarPowerModel::evaluate(const epsim::config::PanelConfiguration& panels,
                                           const OrbitalGeometry& geometry) const {
  const double conditioned = panels.peak_power_w * chain_efficiency_;
  return SolarPowerResult{
      .power_w = conditioned * geometry.projection_factor * geometry.illumination,
      .conditioned_peak_w = conditioned,
  };
}

}  // namespace epsim::eps
