/**
 * @file surface.hpp
 * @brief Positioned surface descriptor handed to the raytrace engine.
 * @author Watosn
 */
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>

#include "rowlandoptics/core/transforms.hpp"
#include "rowlandoptics/core/types.hpp"
#include "rowlandoptics/surfaces/apertures.hpp"
#include "rowlandoptics/surfaces/materials.hpp"
#include "rowlandoptics/surfaces/rulings.hpp"
#include "rowlandoptics/surfaces/sags.hpp"

namespace rowlandoptics::surfaces {

/**
 * @brief Pixel layout of an imaging sensor.
 */
struct SensorGeometry {
  rowlandoptics::core::Vec2 width_pixel_um{};
  std::array<std::string, 2> axis_pixel{"detector_x", "detector_y"};
  std::array<int, 2> num_pixel{};
  double timedelta_exposure_s{};

  friend bool operator==(const SensorGeometry&, const SensorGeometry&) = default;
};

/**
 * @brief Physical extent of the pixel array.
 */
[[nodiscard]] rowlandoptics::core::Vec2 sensor_extent_mm(const SensorGeometry& sensor);

/**
 * @brief One optical surface: optional shape, bounds, material and rulings at a placement.
 *
 * Unset facets stay empty. `sensor` is set only for imaging sensors.
 */
struct Surface {
  std::string name{};
  std::optional<Sag> sag{};
  std::optional<Aperture> aperture{};
  std::optional<Aperture> aperture_mechanical{};
  std::shared_ptr<const IMaterial> material{};
  std::shared_ptr<const IRulings> rulings{};
  std::optional<SensorGeometry> sensor{};
  bool is_field_stop{};
  bool is_pupil_stop{};
  rowlandoptics::core::Transform transformation{rowlandoptics::core::Transform::Identity()};
};

/**
 * @brief Value equality; materials and rulings compare by identity.
 */
[[nodiscard]] bool operator==(const Surface& a, const Surface& b);

/**
 * @brief Position of the local origin of a surface in the instrument frame.
 */
[[nodiscard]] rowlandoptics::core::Vec3 surface_vertex_mm(const Surface& surface);

/**
 * @brief One-line summary of the populated facets of a surface.
 */
[[nodiscard]] std::string describe(const Surface& surface);

}  // namespace rowlandoptics::surfaces
