/**
 * @file component.cpp
 * @brief Shared component placement.
 * @author Watosn
 */

#include "rowlandoptics/components/component.hpp"

#include <cmath>

namespace rowlandoptics::components {

core::Transform Component::transformation() const { return core::pose_transform(pose_); }

core::Transform RowlandComponent::transformation() const {
  return core::rotation_y(anchor_.azimuth_rad) * core::translation_z(anchor_.radius_mm) * Component::transformation();
}

core::Status RowlandComponent::validate(const RowlandAnchor& anchor, const core::Pose& pose) {
  if (!core::is_non_negative(anchor.radius_mm) || !std::isfinite(anchor.azimuth_rad)) {
    return core::Status::RangeError;
  }
  if (!core::is_finite(pose)) {
    return core::Status::RangeError;
  }
  return core::Status::Ok;
}

}  // namespace rowlandoptics::components
