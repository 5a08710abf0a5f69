/**
 * @file transforms.hpp
 * @brief Affine placement helpers and the component pose.
 * @author Watosn
 */
#pragma once

#include <Eigen/Geometry>

#include "rowlandoptics/core/types.hpp"

namespace rowlandoptics::core {

/**
 * @brief Invertible affine map from a local frame into the instrument frame.
 *
 * `a * b` applies `b` first.
 */
using Transform = Eigen::Affine3d;

inline Eigen::Vector3d to_eigen(const Vec3& v) { return Eigen::Vector3d{v.x, v.y, v.z}; }
inline Vec3 from_eigen(const Eigen::Vector3d& v) { return Vec3{v.x(), v.y(), v.z()}; }

inline Transform identity() { return Transform::Identity(); }

inline Transform translation(const Vec3& offset_mm) {
  return Transform(Eigen::Translation3d(to_eigen(offset_mm)));
}

inline Transform translation_z(double offset_mm) { return translation(Vec3{0.0, 0.0, offset_mm}); }

inline Transform rotation_x(double angle_rad) {
  return Transform(Eigen::AngleAxisd(angle_rad, Eigen::Vector3d::UnitX()));
}

inline Transform rotation_y(double angle_rad) {
  return Transform(Eigen::AngleAxisd(angle_rad, Eigen::Vector3d::UnitY()));
}

inline Transform rotation_z(double angle_rad) {
  return Transform(Eigen::AngleAxisd(angle_rad, Eigen::Vector3d::UnitZ()));
}

/**
 * @brief Apply a transform to a point.
 */
inline Vec3 apply(const Transform& t, const Vec3& p) { return from_eigen(t * to_eigen(p)); }

/**
 * @brief Exact element-wise equality of two transforms.
 */
inline bool same_transform(const Transform& a, const Transform& b) { return a.matrix() == b.matrix(); }

/**
 * @brief Tolerance comparison of two transforms.
 */
inline bool approx_transform(const Transform& a, const Transform& b, double tol) {
  return (a.matrix() - b.matrix()).cwiseAbs().maxCoeff() <= tol;
}

/**
 * @brief Local placement of a component: an offset plus three orientation angles.
 *
 * Pitch rotates about x (tangent to the Rowland circle), yaw about y (normal to
 * the plane of the circle), roll about z (the local optic axis).
 */
struct Pose {
  Vec3 translation_mm{};
  double pitch_rad{};
  double yaw_rad{};
  double roll_rad{};

  friend bool operator==(const Pose&, const Pose&) = default;
};

/**
 * @brief Compose a pose as translation * roll * yaw * pitch.
 *
 * A local point is pitched first and translated last.
 */
inline Transform pose_transform(const Pose& pose) {
  return translation(pose.translation_mm) * rotation_z(pose.roll_rad) * rotation_y(pose.yaw_rad)
         * rotation_x(pose.pitch_rad);
}

inline bool is_finite(const Pose& pose) {
  return is_finite(pose.translation_mm) && std::isfinite(pose.pitch_rad) && std::isfinite(pose.yaw_rad)
         && std::isfinite(pose.roll_rad);
}

}  // namespace rowlandoptics::core
