/**
 * @file front_aperture.cpp
 * @brief Front aperture surface.
 * @author Watosn
 */

#include "rowlandoptics/components/front_aperture.hpp"

namespace rowlandoptics::components {

FrontAperture::FrontAperture(Config config)
    : Component(core::Pose{.translation_mm = config.translation_mm}), config_(std::move(config)) {}

core::BuildResult<FrontAperture> FrontAperture::Create(const Config& config) {
  if (!core::is_finite(config.translation_mm)) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<FrontAperture>(new FrontAperture(config))};
}

surfaces::Surface FrontAperture::surface() const {
  return surfaces::Surface{
      .name = config_.name,
      .transformation = transformation(),
  };
}

}  // namespace rowlandoptics::components
