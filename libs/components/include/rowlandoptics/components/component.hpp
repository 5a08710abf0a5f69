/**
 * @file component.hpp
 * @brief Base interfaces of instrument components.
 * @author Watosn
 */
#pragma once

#include "rowlandoptics/core/transforms.hpp"
#include "rowlandoptics/core/types.hpp"
#include "rowlandoptics/surfaces/surface.hpp"

namespace rowlandoptics::components {

/**
 * @brief Anything that produces a positioned optical surface.
 *
 * Neither `transformation()` nor `surface()` caches: both are recomputed from
 * the stored configuration on every call.
 */
class Component {
 public:
  virtual ~Component() = default;

  /**
   * @brief Map from the component's local frame into the instrument frame.
   *
   * The base implementation is the local pose alone.
   */
  [[nodiscard]] virtual rowlandoptics::core::Transform transformation() const;

  /**
   * @brief Surface descriptor placed by `transformation()`.
   */
  [[nodiscard]] virtual rowlandoptics::surfaces::Surface surface() const = 0;

  [[nodiscard]] const rowlandoptics::core::Pose& pose() const { return pose_; }

 protected:
  explicit Component(const rowlandoptics::core::Pose& pose) : pose_(pose) {}

 private:
  rowlandoptics::core::Pose pose_{};
};

/**
 * @brief Anchor of a component on the Rowland circle.
 *
 * The circle lies in the x-z plane, centered on the origin; azimuth is
 * measured from +z toward +x.
 */
struct RowlandAnchor {
  double radius_mm{};
  double azimuth_rad{};
};

/**
 * @brief Component positioned on the Rowland circle.
 *
 * transformation = rotation_y(azimuth) * translation_z(radius) * pose: the
 * posed component is moved out to the circle radius, then swung about the
 * circle's center to its azimuth.
 */
class RowlandComponent : public Component {
 public:
  [[nodiscard]] rowlandoptics::core::Transform transformation() const override;

  [[nodiscard]] double rowland_radius_mm() const { return anchor_.radius_mm; }
  [[nodiscard]] double rowland_azimuth_rad() const { return anchor_.azimuth_rad; }

  /**
   * @brief Status of a candidate anchor and pose.
   *
   * A negative or non-finite radius is a `RangeError`, as is any non-finite
   * angle or offset. Any finite azimuth is accepted.
   */
  [[nodiscard]] static rowlandoptics::core::Status validate(const RowlandAnchor& anchor,
                                                            const rowlandoptics::core::Pose& pose);

 protected:
  RowlandComponent(const RowlandAnchor& anchor, const rowlandoptics::core::Pose& pose)
      : Component(pose), anchor_(anchor) {}

 private:
  RowlandAnchor anchor_{};
};

}  // namespace rowlandoptics::components
