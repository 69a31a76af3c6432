/**
 * @file orbital_geometry.cpp
 * @brief Orbit geometry model implementation.
 * @author Watosn
 */

#include "epsim/eps/orbital_geometry.hpp"

#include <algorithm>
#include <cmath>

#include "epsim/core/constants.hpp"

namespace epsim::eps {

namespace constants = epsim::core::constants;

bool in_eclipse(double theta_deg) { return theta_deg > kEclipseStartDeg && theta_deg < kEclipseEndDeg; }

double projection_factor(double theta_deg) {
  const double theta_eff = (theta_deg - kProjectionPhaseOffsetDeg) * constants::kDegToRad;
  return std::max(0.0, kProjectionBias + kProjectionAmplitude * std::cos(theta_eff));
}

double OrbitalGeometryModel::orbital_angle_deg(double elapsed_s) const {
  return constants::kFullCircleDeg * std::fmod(elapsed_s, orbit_period_s_) / orbit_period_s_;
}

OrbitalGeometry OrbitalGeometryModel::evaluate(double elapsed_s) const {
  const double theta = orbital_angle_deg(elapsed_s);
  const bool eclipsed = in_eclipse(theta);
  return OrbitalGeometry{
      .elapsed_s = elapsed_s,
      .mission_years = elapsed_s / constants::kSecondsPerDay / constants::kDaysPerYear,
      .theta_deg = theta,
      .eclipsed = eclipsed,
      .illumination = eclipsed ? 0.0 : 1.0,
      .projection_factor = projection_factor(theta),
  };
}

}  // namespace epsim::eps
