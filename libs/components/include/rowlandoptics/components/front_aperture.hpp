/**
 * @file front_aperture.hpp
 * @brief Entrance aperture plate of the instrument.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>

#include "rowlandoptics/components/component.hpp"

namespace rowlandoptics::components {

/**
 * @brief Front aperture plate: the entrance to the optical system and the
 * mechanical interface between the optical table and the payload skins.
 *
 * Produces a bare surface (no shape, bounds or material) at its translation.
 */
class FrontAperture final : public Component {
 public:
  struct Config {
    std::string name{"front aperture"};
    rowlandoptics::core::Vec3 translation_mm{};
  };

  /**
   * @brief Validate and build; a non-finite translation is a `RangeError`.
   */
  static rowlandoptics::core::BuildResult<FrontAperture> Create(const Config& config);

  [[nodiscard]] rowlandoptics::surfaces::Surface surface() const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit FrontAperture(Config config);

  Config config_{};
};

}  // namespace rowlandoptics::components
