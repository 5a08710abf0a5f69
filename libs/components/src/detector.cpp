/**
 * @file detector.cpp
 * @brief Detector validation and sensor surface.
 * @author Watosn
 */

#include "rowlandoptics/components/detector.hpp"

#include <cmath>
#include <initializer_list>

namespace rowlandoptics::components {
namespace {

bool valid_electronics(const Detector::Config& c) {
  for (const double v : {c.temperature_k,
                         c.gain_electrons_per_dn,
                         c.readout_noise_dn,
                         c.dark_current_electrons_per_s,
                         c.charge_diffusion_um,
                         c.timedelta_transfer_s,
                         c.timedelta_readout_s,
                         c.timedelta_exposure_s,
                         c.timedelta_exposure_min_s,
                         c.timedelta_exposure_max_s}) {
    if (!core::is_non_negative(v)) {
      return false;
    }
  }
  return c.timedelta_exposure_min_s <= c.timedelta_exposure_max_s && c.bits_adc >= 0;
}

bool valid_pixels(const Detector::Config& c) {
  return core::is_non_negative(c.width_pixel_um.x) && core::is_non_negative(c.width_pixel_um.y) && c.num_pixel[0] >= 0
         && c.num_pixel[1] >= 0 && c.num_pixel_overscan >= 0 && c.num_pixel_blank >= 0;
}

}  // namespace

Detector::Detector(Config config)
    : RowlandComponent(RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad},
                       config.pose),
      config_(std::move(config)) {}

core::BuildResult<Detector> Detector::Create(const Config& config) {
  const auto anchor_status = RowlandComponent::validate(
      RowlandAnchor{.radius_mm = config.rowland_radius_mm, .azimuth_rad = config.rowland_azimuth_rad}, config.pose);
  if (anchor_status != core::Status::Ok) {
    return {.status = anchor_status};
  }
  if (!valid_pixels(config) || !valid_electronics(config)) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<Detector>(new Detector(config))};
}

surfaces::Surface Detector::surface() const {
  return surfaces::Surface{
      .name = config_.name,
      .material = config_.material,
      .sensor =
          surfaces::SensorGeometry{
              .width_pixel_um = config_.width_pixel_um,
              .axis_pixel = config_.axis_pixel,
              .num_pixel = config_.num_pixel,
              .timedelta_exposure_s = config_.timedelta_exposure_s,
          },
      .transformation = transformation(),
  };
}

double Detector::adc_full_scale_dn() const { return std::ldexp(1.0, config_.bits_adc) - 1.0; }

}  // namespace rowlandoptics::components
