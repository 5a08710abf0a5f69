/**
 * @file test_optical_system.cpp
 * @brief End-to-end instrument assembly test.
 * @author Watosn
 */

#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "rowlandoptics/coatings/feed_optic_coating.hpp"
#include "rowlandoptics/components/detector.hpp"
#include "rowlandoptics/components/feed_optic.hpp"
#include "rowlandoptics/components/front_aperture.hpp"
#include "rowlandoptics/components/grating.hpp"
#include "rowlandoptics/components/optical_system.hpp"
#include "rowlandoptics/components/solar_disk.hpp"
#include "rowlandoptics/core/constants.hpp"
#include "rowlandoptics/surfaces/materials.hpp"

int main() {
  using namespace rowlandoptics;
  using core::constants::kDegToRad;
  const double rowland_radius = 1000.0;

  auto coating = coatings::feed_optic_coating_design();
  auto rulings = surfaces::ConstantRulings::Create({.spacing_um = 1.0 / 1.2});
  auto silicon = surfaces::SensorMaterial::Create({});
  if (coating.status != core::Status::Ok || rulings.status != core::Status::Ok || silicon.status != core::Status::Ok) {
    spdlog::error("material construction failed");
    return 1;
  }
  const std::shared_ptr<const surfaces::IMaterial> coating_material = std::move(coating.value);

  components::OpticalSystem system;
  system.add(components::SolarDisk::Create({}).value);
  system.add(components::FrontAperture::Create({.translation_mm = core::Vec3{0.0, 0.0, -200.0}}).value);

  const components::FeedOptic::Config feed{
      .radius_mm = 3.0,
      .aperture_subtent_rad = 60.0 * kDegToRad,
      .aperture_height_mm = 10.0,
      .material = coating_material,
      .rowland_radius_mm = rowland_radius,
  };
  auto feeds = components::feed_optic_array(feed, {5.0 * kDegToRad, 10.0 * kDegToRad});
  if (feeds.status != core::Status::Ok) {
    spdlog::error("feed optic array failed");
    return 2;
  }
  for (auto& optic : feeds.optics) {
    system.add(std::move(optic));
  }
  system.add(components::Grating::Create({
                                             .sag = surfaces::SphericalSag{.radius_mm = -2.0 * rowland_radius},
                                             .width_clear_mm = core::Vec2{50.0, 20.0},
                                             .width_mech_mm = core::Vec2{60.0, 25.0},
                                             .material = coating_material,
                                             .rulings = std::move(rulings.value),
                                             .rowland_radius_mm = rowland_radius,
                                             .rowland_azimuth_rad = 180.0 * kDegToRad,
                                         })
                 .value);
  system.add(components::Detector::Create({
                                              .width_pixel_um = core::Vec2{15.0, 15.0},
                                              .num_pixel = {2048, 1024},
                                              .material = std::move(silicon.value),
                                              .rowland_radius_mm = rowland_radius,
                                              .rowland_azimuth_rad = 20.0 * kDegToRad,
                                          })
                 .value);
  // A failed factory contributes nothing.
  system.add(components::Grating::Create({.rowland_radius_mm = -1.0}).value);

  if (system.size() != 6) {
    spdlog::error("unexpected component count {}", system.size());
    return 3;
  }
  const std::vector<surfaces::Surface> exported = system.surfaces();
  if (exported.size() != 6 || exported.front().name != "solar disk" || exported[1].name != "front aperture"
      || exported[2].name != "feed optic" || exported[4].name != "grating" || exported.back().name != "detector") {
    spdlog::error("surfaces out of order");
    return 4;
  }
  int field_stops = 0;
  int pupil_stops = 0;
  for (const auto& s : exported) {
    field_stops += s.is_field_stop ? 1 : 0;
    pupil_stops += s.is_pupil_stop ? 1 : 0;
  }
  if (field_stops != 1 || pupil_stops != 1) {
    spdlog::error("stop flags mismatch");
    return 5;
  }

  const auto grating_vertex = surfaces::surface_vertex_mm(exported[4]);
  if (std::abs(grating_vertex.z + rowland_radius) > 1e-9 || std::abs(grating_vertex.x) > 1e-9) {
    spdlog::error("grating not opposite the feed optics on the circle");
    return 6;
  }
  for (const auto& s : exported) {
    const auto v = surfaces::surface_vertex_mm(s);
    if (!core::is_finite(v)) {
      spdlog::error("non-finite vertex for {}", s.name);
      return 7;
    }
    spdlog::info("{}", surfaces::describe(s));
  }
  if (!(system.at(4).surface() == exported[4])) {
    spdlog::error("component surface differs from the exported one");
    return 8;
  }

  return 0;
}
