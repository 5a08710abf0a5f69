/**
 * @file rowland_layout_cli.cpp
 * @brief Print the placement of a feed optic array on the Rowland circle.
 * @author Watosn
 */

#include <cstdlib>
#include <memory>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rowlandoptics/coatings/feed_optic_coating.hpp"
#include "rowlandoptics/components/feed_optic.hpp"
#include "rowlandoptics/core/constants.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    spdlog::error("usage: rowland_layout_cli <rowland_radius_mm> <azimuth_deg> [azimuth_deg...]");
    return 1;
  }

  namespace ro = rowlandoptics;
  const double rowland_radius_mm = std::atof(argv[1]);
  std::vector<double> azimuths_rad;
  for (int i = 2; i < argc; ++i) {
    azimuths_rad.push_back(std::atof(argv[i]) * ro::core::constants::kDegToRad);
  }

  auto coating = ro::coatings::feed_optic_coating_design();
  if (coating.status != ro::core::Status::Ok) {
    spdlog::error("feed optic coating unavailable: {}", ro::core::to_string(coating.status));
    return 2;
  }

  const ro::components::FeedOptic::Config base{
      .radius_mm = 3.0,
      .aperture_subtent_rad = 60.0 * ro::core::constants::kDegToRad,
      .aperture_height_mm = 10.0,
      .margin_polishing_mm = 1.0,
      .margin_mounting_mm = 5.0,
      .material = std::shared_ptr<const ro::surfaces::IMaterial>(std::move(coating.value)),
      .rowland_radius_mm = rowland_radius_mm,
  };
  const auto array = ro::components::feed_optic_array(base, azimuths_rad);
  if (array.status != ro::core::Status::Ok) {
    spdlog::error("feed optic array rejected: {}", ro::core::to_string(array.status));
    return 3;
  }

  for (const auto& optic : array.optics) {
    const auto surface = optic->surface();
    const auto image = ro::surfaces::surface_vertex_mm(surface);
    fmt::print("azimuth_deg={:.4f} image_mm=({:.6f}, {:.6f}, {:.6f})\n",
               optic->rowland_azimuth_rad() * ro::core::constants::kRadToDeg, image.x, image.y, image.z);
    fmt::print("  {}\n", ro::surfaces::describe(surface));
  }
  spdlog::info("placed {} feed optics on a {} mm Rowland circle", array.optics.size(), rowland_radius_mm);
  return 0;
}
