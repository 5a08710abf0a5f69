/**
 * @file constants.hpp
 * @brief Shared unit conversions and instrument constants.
 * @author Watosn
 */
#pragma once

namespace rowlandoptics::core::constants {

inline constexpr double kPi = 3.1415926535897932384626433832795;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;

inline constexpr double kMmPerUm = 1.0e-3;
inline constexpr double kNmPerUm = 1.0e3;
inline constexpr double kNmPerMm = 1.0e6;

// Photon energy [eV] times wavelength [nm].
inline constexpr double kHcEvNm = 1239.84198;

// Mean angular radius of the solar disk seen from Earth.
inline constexpr double kSolarAverageAngularRadiusArcsec = 959.63;

}  // namespace rowlandoptics::core::constants
