/**
 * @file test_grating_detector.cpp
 * @brief Grating and detector surface facet tests.
 * @author Watosn
 */

#include <cmath>
#include <memory>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "rowlandoptics/components/detector.hpp"
#include "rowlandoptics/components/grating.hpp"
#include "rowlandoptics/core/constants.hpp"
#include "rowlandoptics/surfaces/materials.hpp"
#include "rowlandoptics/surfaces/rulings.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace rowlandoptics;
  using components::Detector;
  using components::Grating;
  using core::constants::kDegToRad;

  const double rowland_radius = 1000.0;
  const auto coating = std::make_shared<const surfaces::Mirror>();
  auto built_rulings = surfaces::ConstantRulings::Create({.spacing_um = 0.5, .diffraction_order = -1});
  if (built_rulings.status != core::Status::Ok) {
    spdlog::error("rulings construction failed");
    return 1;
  }
  const std::shared_ptr<const surfaces::IRulings> rulings = std::move(built_rulings.value);

  const Grating::Config grating_config{
      .sag = surfaces::SphericalSag{.radius_mm = -2.0 * rowland_radius},
      .radius_mm = -2.0 * rowland_radius,
      .width_clear_mm = core::Vec2{100.0, 20.0},
      .width_mech_mm = core::Vec2{110.0, 30.0},
      .material = coating,
      .rulings = rulings,
      .rowland_radius_mm = rowland_radius,
      .rowland_azimuth_rad = 175.0 * kDegToRad,
  };
  const auto grating = Grating::Create(grating_config);
  if (grating.status != core::Status::Ok) {
    spdlog::error("grating construction failed");
    return 2;
  }
  const auto gs = grating.value->surface();
  if (!gs.sag || !(*gs.sag == surfaces::Sag{surfaces::SphericalSag{.radius_mm = -2000.0}})) {
    spdlog::error("grating sag mismatch");
    return 3;
  }
  const auto* clear = gs.aperture ? std::get_if<surfaces::RectangularAperture>(&*gs.aperture) : nullptr;
  const auto* mech =
      gs.aperture_mechanical ? std::get_if<surfaces::RectangularAperture>(&*gs.aperture_mechanical) : nullptr;
  if (clear == nullptr || mech == nullptr || !(clear->half_width_mm == core::Vec2{50.0, 10.0})
      || !(mech->half_width_mm == core::Vec2{55.0, 15.0})) {
    spdlog::error("grating apertures mismatch");
    return 4;
  }
  if (gs.material != coating || gs.rulings != rulings || !gs.is_pupil_stop || gs.is_field_stop || gs.sensor
      || gs.name != "grating") {
    spdlog::error("grating surface facets mismatch");
    return 5;
  }
  if (gs.rulings->diffraction_order() != -1) {
    spdlog::error("grating rulings not carried through");
    return 6;
  }

  const auto bare = Grating::Create({.rowland_radius_mm = rowland_radius});
  const auto bs = bare.value->surface();
  if (bs.sag || bs.material || bs.rulings || !bs.aperture || !bs.is_pupil_stop) {
    spdlog::error("bare grating facets mismatch");
    return 7;
  }
  auto bad_grating = grating_config;
  bad_grating.width_mech_mm = core::Vec2{-1.0, 30.0};
  if (Grating::Create(bad_grating).status != core::Status::RangeError) {
    spdlog::error("negative grating width accepted");
    return 8;
  }

  auto built_silicon = surfaces::SensorMaterial::Create({.name = "silicon", .quantum_efficiency = 0.85});
  const std::shared_ptr<const surfaces::IMaterial> silicon = std::move(built_silicon.value);
  const Detector::Config detector_config{
      .manufacturer = "MSFC",
      .model_number = "CCD-1",
      .serial_number = "0001",
      .width_pixel_um = core::Vec2{15.0, 15.0},
      .num_pixel = {2048, 1024},
      .num_pixel_overscan = 2,
      .num_pixel_blank = 50,
      .material = silicon,
      .rowland_radius_mm = rowland_radius,
      .rowland_azimuth_rad = 10.0 * kDegToRad,
      .temperature_k = 183.0,
      .gain_electrons_per_dn = 2.5,
      .readout_noise_dn = 4.0,
      .dark_current_electrons_per_s = 0.001,
      .charge_diffusion_um = 5.0,
      .timedelta_transfer_s = 0.05,
      .timedelta_readout_s = 1.1,
      .timedelta_exposure_s = 0.2,
      .timedelta_exposure_min_s = 0.002,
      .timedelta_exposure_max_s = 600.0,
      .bits_adc = 16,
  };
  const auto detector = Detector::Create(detector_config);
  if (detector.status != core::Status::Ok) {
    spdlog::error("detector construction failed: {}", core::to_string(detector.status));
    return 9;
  }
  const auto ds = detector.value->surface();
  if (ds.sag || ds.aperture || ds.aperture_mechanical || ds.rulings || ds.is_field_stop || ds.is_pupil_stop) {
    spdlog::error("detector surface carries optic facets");
    return 10;
  }
  if (!ds.sensor || ds.material != silicon || ds.name != "detector") {
    spdlog::error("detector sensor facets missing");
    return 11;
  }
  if (!(ds.sensor->width_pixel_um == core::Vec2{15.0, 15.0}) || ds.sensor->num_pixel[0] != 2048
      || ds.sensor->num_pixel[1] != 1024 || ds.sensor->axis_pixel[0] != "detector_x"
      || ds.sensor->timedelta_exposure_s != 0.2) {
    spdlog::error("detector sensor geometry mismatch");
    return 12;
  }
  if (!approx(detector.value->adc_full_scale_dn(), 65535.0, 0.0)) {
    spdlog::error("adc full scale mismatch");
    return 13;
  }

  // Readout electronics do not reach the surface.
  auto noisy = detector_config;
  noisy.gain_electrons_per_dn = 10.0;
  noisy.readout_noise_dn = 20.0;
  noisy.temperature_k = 300.0;
  if (!(Detector::Create(noisy).value->surface() == ds)) {
    spdlog::error("electronics fields changed the detector surface");
    return 14;
  }

  auto bad = detector_config;
  bad.timedelta_exposure_min_s = 1000.0;
  if (Detector::Create(bad).status != core::Status::RangeError) {
    spdlog::error("exposure minimum above maximum accepted");
    return 15;
  }
  bad = detector_config;
  bad.num_pixel = {-1, 1024};
  if (Detector::Create(bad).status != core::Status::RangeError) {
    spdlog::error("negative pixel count accepted");
    return 16;
  }
  bad = detector_config;
  bad.temperature_k = -1.0;
  if (Detector::Create(bad).status != core::Status::RangeError) {
    spdlog::error("negative temperature accepted");
    return 17;
  }

  return 0;
}
