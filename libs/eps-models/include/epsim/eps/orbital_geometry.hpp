/**
 * @file orbital_geometry.hpp
 * @brief Angular orbit phase, eclipse and panel projection model.
 * @author Watosn
 */
#pragma once

#include "epsim/config/simulation_config.hpp"

namespace epsim::eps {

/**
 * @brief Open interval of orbital angle (deg) in which the sun is occluded.
 */
inline constexpr double kEclipseStartDeg = 120.0;
inline constexpr double kEclipseEndDeg = 270.0;

/**
 * @brief Panel incidence model `max(0, bias + amplitude * cos(theta - offset))`.
 */
inline constexpr double kProjectionBias = 0.6;
inline constexpr double kProjectionAmplitude = 0.4;
inline constexpr double kProjectionPhaseOffsetDeg = 45.0;

/**
 * @brief Orbit geometry sample at one elapsed mission time.
 */
struct OrbitalGeometry {
  double elapsed_s{};
  double mission_years{};
  double theta_deg{};
  bool eclipsed{};
  /// 1 when illuminated, 0 inside the eclipse interval.
  double illumination{1.0};
  double projection_factor{};
};

/**
 * @brief Simplified circular-orbit sun geometry.
 */
class OrbitalGeometryModel final {
 public:
  explicit OrbitalGeometryModel(double orbit_period_s) : orbit_period_s_(orbit_period_s) {}
  explicit OrbitalGeometryModel(const epsim::config::SimulationConfig& config)
      : OrbitalGeometryModel(config.orbit_period_s) {}

  /**
   * @brief Evaluate geometry at elapsed mission time `elapsed_s` (>= 0).
   */
  [[nodiscard]] OrbitalGeometry evaluate(double elapsed_s) const;

  /**
   * @brief Orbital angle in `[0, 360)` for an elapsed time.
   */
  [[nodiscard]] double orbital_angle_deg(double elapsed_s) const;

 private:
  double orbit_period_s_{};
};

/**
 * @brief True when `theta_deg` lies strictly inside the eclipse interval.
 */
[[nodiscard]] bool in_eclipse(double theta_deg);

/**
 * @brief Panel projection factor in `[0, 1]` at orbital angle `theta_deg`.
 */
[[nodiscard]] double projection_factor(double theta_deg);

}  // namespace epsim::eps
