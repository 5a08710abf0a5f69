/**
 * @file solar_disk.cpp
 * @brief Solar disk source surface.
 * @author Watosn
 */

#include "rowlandoptics/components/solar_disk.hpp"

#include <cmath>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::components {

SolarDisk::SolarDisk(Config config)
    : Component(core::Pose{.translation_mm = config.translation_mm}), config_(std::move(config)) {}

core::BuildResult<SolarDisk> SolarDisk::Create(const Config& config) {
  Config resolved = config;
  if (!resolved.radius_rad) {
    resolved.radius_rad =
        core::constants::kSolarAverageAngularRadiusArcsec * core::constants::kArcsecToRad;
  }
  if (!core::is_non_negative(*resolved.radius_rad) || !core::is_finite(resolved.translation_mm)) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<SolarDisk>(new SolarDisk(std::move(resolved)))};
}

surfaces::Surface SolarDisk::surface() const {
  return surfaces::Surface{
      .name = config_.name,
      .aperture = surfaces::CircularAperture{.radius = std::cos(*config_.radius_rad)},
      .is_field_stop = true,
      .transformation = transformation(),
  };
}

}  // namespace rowlandoptics::components
