/**
 * @file grating.cpp
 * @brief Grating surface.
 * @author Watosn
 */

#include "rowlandoptics/components/grating.hpp"

#include <cmath>

namespace rowlandoptics::components {
namespace {

bool is_non_negative(const core::Vec2& width) {
  return core::is_non_negative(width.x) && core::is_non_negative(width.y);
}

}  // namespace

Grating::Grating(Config config)
    : RowlandComponent(RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad},
                       config.pose),
      config_(std::move(config)) {}

core::BuildResult<Grating> Grating::Create(const Config& config) {
  const auto anchor_status = RowlandComponent::validate(
      RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad}, config.pose);
  if (anchor_status != core::Status::Ok) {
    return {.status = anchor_status};
  }
  if (!std::isfinite(config.radius_mm) || !is_non_negative(config.width_clear_mm)
      || !is_non_negative(config.width_mech_mm)) {
    return {.status = core::Status::RangeError};
  }
  if (config.sag && !std::isfinite(surfaces::sag_radius_mm(*config.sag))) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<Grating>(new Grating(config))};
}

surfaces::Surface Grating::surface() const {
  return surfaces::Surface{
      .name = config_.name,
      .sag = config_.sag,
      .aperture = surfaces::RectangularAperture{.half_width_mm = config_.width_clear_mm / 2.0},
      .aperture_mechanical = surfaces::RectangularAperture{.half_width_mm = config_.width_mech_mm / 2.0},
      .material = config_.material,
      .rulings = config_.rulings,
      .is_pupil_stop = true,
      .transformation = transformation(),
  };
}

}  // namespace rowlandoptics::components
