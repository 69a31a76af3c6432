/**
 * @file constants.hpp
 * @brief Shared time and angle constants.
 * @author Watosn
 */
#pragma once

namespace epsim::core::constants {

inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kDaysPerYear = 365.0;
inline constexpr double kDaysPerMonth = 30.0;
inline constexpr double kFullCircleDeg = 360.0;
inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kDegToRad = kPi / 180.0;

}  // namespace epsim::core::constants
