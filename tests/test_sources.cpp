/**
 * @file test_sources.cpp
 * @brief Front aperture and solar disk surface tests.
 * @author Watosn
 */

#include <cmath>
#include <variant>

#include <spdlog/spdlog.h>

#include "rowlandoptics/components/front_aperture.hpp"
#include "rowlandoptics/components/solar_disk.hpp"
#include "rowlandoptics/core/constants.hpp"

int main() {
  using namespace rowlandoptics;
  using components::FrontAperture;
  using components::SolarDisk;

  const auto front = FrontAperture::Create({});
  if (front.status != core::Status::Ok) {
    spdlog::error("front aperture construction failed");
    return 1;
  }
  const auto fs = front.value->surface();
  if (fs.name != "front aperture" || fs.sag || fs.material || fs.aperture || fs.aperture_mechanical || fs.rulings
      || fs.sensor || fs.is_field_stop || fs.is_pupil_stop) {
    spdlog::error("front aperture surface carries unexpected facets");
    return 2;
  }
  if (!core::approx_transform(fs.transformation, core::identity(), 1e-15)) {
    spdlog::error("front aperture at zero translation is not identity");
    return 3;
  }

  const auto shifted = FrontAperture::Create({.translation_mm = core::Vec3{1.0, 2.0, 3.0}});
  if (!(surfaces::surface_vertex_mm(shifted.value->surface()) == core::Vec3{1.0, 2.0, 3.0})) {
    spdlog::error("front aperture translation mismatch");
    return 4;
  }
  if (FrontAperture::Create({.translation_mm = core::Vec3{0.0, std::nan(""), 0.0}}).status
      != core::Status::RangeError) {
    spdlog::error("non-finite front aperture translation accepted");
    return 5;
  }

  const double radius_rad = 1000.0 * core::constants::kArcsecToRad;
  const auto disk = SolarDisk::Create({.radius_rad = radius_rad});
  if (disk.status != core::Status::Ok) {
    spdlog::error("solar disk construction failed");
    return 6;
  }
  const auto ds = disk.value->surface();
  const auto* circle = ds.aperture ? std::get_if<surfaces::CircularAperture>(&*ds.aperture) : nullptr;
  if (circle == nullptr || std::abs(circle->radius - std::cos(radius_rad)) > 1e-15 || !(circle->radius > 0.0)) {
    spdlog::error("solar disk aperture radius mismatch");
    return 7;
  }
  if (ds.name != "solar disk" || !ds.is_field_stop || ds.is_pupil_stop || ds.sag || ds.material
      || ds.aperture_mechanical) {
    spdlog::error("solar disk surface facets mismatch");
    return 8;
  }

  const auto nominal = SolarDisk::Create({});
  const double expected = core::constants::kSolarAverageAngularRadiusArcsec * core::constants::kArcsecToRad;
  if (nominal.status != core::Status::Ok || !nominal.value->config().radius_rad
      || nominal.value->radius_rad() != expected) {
    spdlog::error("default solar radius not resolved at construction");
    return 9;
  }

  if (SolarDisk::Create({.radius_rad = -1.0e-3}).status != core::Status::RangeError) {
    spdlog::error("negative solar radius accepted");
    return 10;
  }

  if (!(nominal.value->surface() == nominal.value->surface())) {
    spdlog::error("solar disk surface is not deterministic");
    return 11;
  }

  return 0;
}
