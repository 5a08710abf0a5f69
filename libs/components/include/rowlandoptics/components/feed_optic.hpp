/**
 * @file feed_optic.hpp
 * @brief Cylindrical feed optics placed on the Rowland circle.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rowlandoptics/components/component.hpp"
#include "rowlandoptics/surfaces/materials.hpp"

namespace rowlandoptics::components {

/**
 * @brief Tall, narrow cylindrical mirror acting as the slit of the spectrograph.
 *
 * The Rowland anchor locates the virtual image of the Sun formed by the optic,
 * not the optic's vertex:
 *
 *   transformation = translation_z(r / 2) * rowland * rotation_y(-azimuth) * translation_z(-r)
 *
 * where `rowland` is the placement of `RowlandComponent` and r the radius of
 * curvature.
 */
class FeedOptic final : public RowlandComponent {
 public:
  struct Config {
    std::string name{"feed optic"};
    /// Radius of curvature of the cylinder.
    double radius_mm{};
    /// Angular width of the clear aperture.
    double aperture_subtent_rad{};
    /// Physical height of the clear aperture.
    double aperture_height_mm{};
    /// Height above and below the clear aperture needed to hold the optic for polishing.
    double margin_polishing_mm{};
    /// Length of the optic held in its mount.
    double margin_mounting_mm{};
    std::shared_ptr<const rowlandoptics::surfaces::IMaterial> material{};
    double rowland_radius_mm{};
    double rowland_azimuth_rad{};
    rowlandoptics::core::Pose pose{};
  };

  /**
   * @brief Validate and build.
   *
   * Negative or non-finite lengths (radius, aperture height, margins, Rowland
   * radius) and non-finite angles are a `RangeError`.
   */
  static rowlandoptics::core::BuildResult<FeedOptic> Create(const Config& config);

  [[nodiscard]] rowlandoptics::core::Transform transformation() const override;

  /**
   * @brief Cylindrical surface with a clear aperture and a larger mechanical
   * aperture inflated by the polishing and mounting margins.
   */
  [[nodiscard]] rowlandoptics::surfaces::Surface surface() const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit FeedOptic(Config config);

  Config config_{};
};

/**
 * @brief Batch of feed optics built from one config over many azimuths.
 */
struct FeedOpticArray {
  std::vector<std::unique_ptr<FeedOptic>> optics{};
  rowlandoptics::core::Status status{rowlandoptics::core::Status::Ok};
};

/**
 * @brief Build one feed optic per azimuth, all other fields taken from `base`.
 *
 * Stops at the first failure; `optics` is empty unless `status` is `Ok`.
 */
[[nodiscard]] FeedOpticArray feed_optic_array(const FeedOptic::Config& base, const std::vector<double>& azimuths_rad);

}  // namespace rowlandoptics::components
