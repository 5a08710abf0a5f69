/**
 * @file grating.hpp
 * @brief Concave diffraction grating on the Rowland circle.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "rowlandoptics/components/component.hpp"
#include "rowlandoptics/surfaces/materials.hpp"
#include "rowlandoptics/surfaces/rulings.hpp"
#include "rowlandoptics/surfaces/sags.hpp"

namespace rowlandoptics::components {

/**
 * @brief Diffraction grating with a rectangular aperture; the pupil stop of the system.
 *
 * Shape, coating and rulings are each optional and carried unchanged onto the
 * surface.
 */
class Grating final : public RowlandComponent {
 public:
  struct Config {
    std::string name{"grating"};
    std::optional<rowlandoptics::surfaces::Sag> sag{};
    /// Nominal radius of curvature of the substrate.
    double radius_mm{};
    /// Full width and height of the clear aperture.
    rowlandoptics::core::Vec2 width_clear_mm{};
    /// Full width and height of the substrate.
    rowlandoptics::core::Vec2 width_mech_mm{};
    std::shared_ptr<const rowlandoptics::surfaces::IMaterial> material{};
    std::shared_ptr<const rowlandoptics::surfaces::IRulings> rulings{};
    double rowland_radius_mm{};
    double rowland_azimuth_rad{};
    rowlandoptics::core::Pose pose{};
  };

  /**
   * @brief Validate and build; negative or non-finite widths, a non-finite
   * radius, and an invalid Rowland anchor are a `RangeError`.
   */
  static rowlandoptics::core::BuildResult<Grating> Create(const Config& config);

  [[nodiscard]] rowlandoptics::surfaces::Surface surface() const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit Grating(Config config);

  Config config_{};
};

}  // namespace rowlandoptics::components
