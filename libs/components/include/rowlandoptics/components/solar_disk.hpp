/**
 * @file solar_disk.hpp
 * @brief Nominal scene: the full solar disk.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <utility>

#include "rowlandoptics/components/component.hpp"

namespace rowlandoptics::components {

/**
 * @brief Source component covering the whole solar disk.
 */
class SolarDisk final : public Component {
 public:
  struct Config {
    std::string name{"solar disk"};
    /// Angular radius of the disk; unset means the average solar angular radius.
    std::optional<double> radius_rad{};
    /// Offset of the disk on the celestial sphere.
    rowlandoptics::core::Vec3 translation_mm{};
  };

  /**
   * @brief Validate, resolve the default radius, and build.
   *
   * A negative or non-finite radius, or a non-finite translation, is a
   * `RangeError`. The stored config always carries a radius.
   */
  static rowlandoptics::core::BuildResult<SolarDisk> Create(const Config& config);

  /**
   * @brief Field-stop surface bounded by a circle of radius cos(radius_rad).
   */
  [[nodiscard]] rowlandoptics::surfaces::Surface surface() const override;

  [[nodiscard]] double radius_rad() const { return *config_.radius_rad; }
  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit SolarDisk(Config config);

  Config config_{};
};

}  // namespace rowlandoptics::components
