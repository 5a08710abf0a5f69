/**
 * @file feed_optic.cpp
 * @brief Feed optic placement and surface.
 * @author Watosn
 */

#include "rowlandoptics/components/feed_optic.hpp"

#include <cmath>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::components {
namespace {

constexpr double kMechanicalWidthFraction = 0.99;
constexpr int kMechanicalSamplesWire = 1001;

bool valid_lengths(const FeedOptic::Config& c) {
  return core::is_non_negative(c.radius_mm) && core::is_non_negative(c.aperture_height_mm)
         && core::is_non_negative(c.margin_polishing_mm) && core::is_non_negative(c.margin_mounting_mm)
         && c.aperture_subtent_rad >= 0.0 && c.aperture_subtent_rad <= 2.0 * core::constants::kPi;
}

}  // namespace

FeedOptic::FeedOptic(Config config)
    : RowlandComponent(RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad},
                       config.pose),
      config_(std::move(config)) {}

core::BuildResult<FeedOptic> FeedOptic::Create(const Config& config) {
  const auto anchor_status = RowlandComponent::validate(
      RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad}, config.pose);
  if (anchor_status != core::Status::Ok) {
    return {.status = anchor_status};
  }
  if (!valid_lengths(config)) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<FeedOptic>(new FeedOptic(config))};
}

core::Transform FeedOptic::transformation() const {
  const double r = config_.radius_mm;
  return core::translation_z(r / 2.0) * RowlandComponent::transformation()
         * core::rotation_y(-config_.rowland_azimuth_rad) * core::translation_z(-r);
}

surfaces::Surface FeedOptic::surface() const {
  const auto& c = config_;
  const double half_height_mm = c.aperture_height_mm / 2.0;
  return surfaces::Surface{
      .name = c.name,
      .sag = surfaces::CylindricalSag{.radius_mm = c.radius_mm},
      .aperture =
          surfaces::RectangularAperture{
              .half_width_mm = core::Vec2{c.radius_mm * std::sin(c.aperture_subtent_rad / 2.0), half_height_mm},
          },
      .aperture_mechanical =
          surfaces::RectangularAperture{
              .half_width_mm = core::Vec2{kMechanicalWidthFraction * c.radius_mm,
                                          half_height_mm + c.margin_mounting_mm + c.margin_polishing_mm},
              .offset_mm = core::Vec2{0.0, c.margin_polishing_mm - c.margin_mounting_mm},
              .samples_wire = kMechanicalSamplesWire,
          },
      .material = c.material,
      .transformation = transformation(),
  };
}

FeedOpticArray feed_optic_array(const FeedOptic::Config& base, const std::vector<double>& azimuths_rad) {
  FeedOpticArray out{};
  out.optics.reserve(azimuths_rad.size());
  for (const double azimuth : azimuths_rad) {
    auto config = base;
    config.rowland_azimuth_rad = azimuth;
    auto built = FeedOptic::Create(config);
    if (built.status != core::Status::Ok) {
      return FeedOpticArray{.status = built.status};
    }
    out.optics.push_back(std::move(built.value));
  }
  return out;
}

}  // namespace rowlandoptics::components
