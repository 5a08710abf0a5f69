/**
 * @file apertures.hpp
 * @brief Clear and mechanical aperture shapes.
 * @author Watosn
 */
#pragma once

#include <variant>

#include "rowlandoptics/core/types.hpp"

namespace rowlandoptics::surfaces {

/**
 * @brief Circular aperture centered at `offset`.
 *
 * `radius` shares the unit of the surface coordinates it bounds; field stops
 * on the sky use direction cosines and the radius is dimensionless there.
 */
struct CircularAperture {
  double radius{};
  rowlandoptics::core::Vec2 offset{};

  friend bool operator==(const CircularAperture&, const CircularAperture&) = default;
};

/**
 * @brief Rectangular aperture centered at `offset_mm`.
 */
struct RectangularAperture {
  rowlandoptics::core::Vec2 half_width_mm{};
  rowlandoptics::core::Vec2 offset_mm{};
  int samples_wire{101};

  friend bool operator==(const RectangularAperture&, const RectangularAperture&) = default;
};

using Aperture = std::variant<CircularAperture, RectangularAperture>;

/**
 * @brief True when local point (x, y) lies inside or on the aperture boundary.
 */
[[nodiscard]] bool aperture_contains(const Aperture& aperture, double x, double y);

/**
 * @brief Area enclosed by the aperture.
 */
[[nodiscard]] double aperture_area(const Aperture& aperture);

}  // namespace rowlandoptics::surfaces
