/**
 * @file sags.hpp
 * @brief Surface-height profiles of optical surfaces.
 * @author Watosn
 */
#pragma once

#include <variant>

namespace rowlandoptics::surfaces {

/**
 * @brief Rotationally symmetric spherical profile.
 *
 * A zero radius denotes a flat surface.
 */
struct SphericalSag {
  double radius_mm{};

  friend bool operator==(const SphericalSag&, const SphericalSag&) = default;
};

/**
 * @brief Cylindrical profile curved along local x, straight along local y.
 */
struct CylindricalSag {
  double radius_mm{};

  friend bool operator==(const CylindricalSag&, const CylindricalSag&) = default;
};

using Sag = std::variant<SphericalSag, CylindricalSag>;

/**
 * @brief Surface height at local position (x, y).
 *
 * Returns NaN outside the domain of the profile (|x| > |radius|).
 */
[[nodiscard]] double sag_mm(const Sag& sag, double x_mm, double y_mm);

/**
 * @brief Radius of curvature of a profile.
 */
[[nodiscard]] double sag_radius_mm(const Sag& sag);

}  // namespace rowlandoptics::surfaces
