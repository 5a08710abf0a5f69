/**
 * @file test_core_transforms.cpp
 * @brief Affine placement and pose composition tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "rowlandoptics/core/constants.hpp"
#include "rowlandoptics/core/transforms.hpp"

namespace {

bool approx(const rowlandoptics::core::Vec3& a, const rowlandoptics::core::Vec3& b, double tol) {
  return std::abs(a.x - b.x) <= tol && std::abs(a.y - b.y) <= tol && std::abs(a.z - b.z) <= tol;
}

}  // namespace

int main() {
  using namespace rowlandoptics::core;
  constexpr double kQuarter = 0.5 * constants::kPi;

  if (!approx_transform(pose_transform(Pose{}), identity(), 1e-15)) {
    spdlog::error("zero pose is not identity");
    return 1;
  }

  const Pose shifted{.translation_mm = Vec3{1.0, 2.0, 3.0}};
  if (!approx(apply(pose_transform(shifted), Vec3{}), Vec3{1.0, 2.0, 3.0}, 1e-15)) {
    spdlog::error("translation-only pose mismatch");
    return 2;
  }

  // Rotation acts in the local frame before the translation.
  const Pose yawed{.translation_mm = Vec3{1.0, 0.0, 0.0}, .yaw_rad = kQuarter};
  if (!approx(apply(pose_transform(yawed), Vec3{0.0, 0.0, 1.0}), Vec3{2.0, 0.0, 0.0}, 1e-12)) {
    spdlog::error("pose translation applied before rotation");
    return 3;
  }

  // Pitch is applied before yaw.
  const Pose pitched_yawed{.pitch_rad = kQuarter, .yaw_rad = kQuarter};
  if (!approx(apply(pose_transform(pitched_yawed), Vec3{0.0, 1.0, 0.0}), Vec3{1.0, 0.0, 0.0}, 1e-12)) {
    spdlog::error("pitch/yaw order mismatch");
    return 4;
  }

  // Roll is applied after yaw.
  const Pose yawed_rolled{.yaw_rad = kQuarter, .roll_rad = kQuarter};
  if (!approx(apply(pose_transform(yawed_rolled), Vec3{0.0, 0.0, 1.0}), Vec3{0.0, 1.0, 0.0}, 1e-12)) {
    spdlog::error("yaw/roll order mismatch");
    return 5;
  }

  const Pose general{
      .translation_mm = Vec3{-4.0, 0.5, 12.0},
      .pitch_rad = 0.1,
      .yaw_rad = -0.3,
      .roll_rad = 2.0,
  };
  const Transform t = pose_transform(general);
  if (!approx_transform(t.inverse() * t, identity(), 1e-12)) {
    spdlog::error("pose inverse mismatch");
    return 6;
  }
  const Vec3 p{3.0, -1.0, 7.0};
  if (std::abs(norm(apply(t, p) - general.translation_mm) - norm(p)) > 1e-12) {
    spdlog::error("pose rotation is not rigid");
    return 7;
  }

  if (!approx_transform(rotation_y(2.0 * constants::kPi + 0.25), rotation_y(0.25), 1e-12)) {
    spdlog::error("rotation not periodic in a full turn");
    return 8;
  }

  if (!approx(apply(translation_z(5.0) * rotation_x(kQuarter), Vec3{0.0, 1.0, 0.0}), Vec3{0.0, 0.0, 6.0}, 1e-12)) {
    spdlog::error("composition order mismatch");
    return 9;
  }

  if (is_finite(Pose{.pitch_rad = std::nan("")}) || !is_finite(general)) {
    spdlog::error("pose finiteness check failed");
    return 10;
  }

  if (!same_transform(identity(), Transform::Identity()) || same_transform(identity(), translation_z(1e-9))) {
    spdlog::error("exact transform comparison failed");
    return 11;
  }

  return 0;
}
