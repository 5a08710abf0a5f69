/**
 * @file feed_optic_coating.cpp
 * @brief Feed-optic coating catalogue.
 * @author Watosn
 */

#include "rowlandoptics/coatings/feed_optic_coating.hpp"

#include <utility>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::coatings {

core::BuildResult<MultilayerMirror> feed_optic_coating_design() {
  return MultilayerMirror::Create(MultilayerMirror::Config{
      .name = "feed optic coating",
      .layers =
          {
              Layer{.chemical = "MgF2", .thickness_nm = 25.0},
              Layer{.chemical = "Al", .thickness_nm = 50.0},
          },
      .substrate = Layer{.chemical = "SiO2", .thickness_nm = 3.0 * core::constants::kNmPerMm},
  });
}

core::BuildResult<MeasuredMirror> coating_witness_measured(const std::filesystem::path& table, double incidence_rad) {
  auto loaded = load_reflectance_table(table, incidence_rad);
  if (loaded.status != core::Status::Ok) {
    return {.status = loaded.status};
  }
  return MeasuredMirror::Create(MeasuredMirror::Config{
      .name = "feed optic witness",
      .measurement = std::move(loaded.measurement),
  });
}

CoatingFitResult coating_witness_fit(const std::filesystem::path& table,
                                     double incidence_rad,
                                     const CoatingFitConfig& config) {
  const auto loaded = load_reflectance_table(table, incidence_rad);
  if (loaded.status != core::Status::Ok) {
    return CoatingFitResult{.status = loaded.status};
  }
  const auto design = feed_optic_coating_design();
  if (design.status != core::Status::Ok) {
    return CoatingFitResult{.status = design.status};
  }
  return fit_coating(*design.value, loaded.measurement, config);
}

}  // namespace rowlandoptics::coatings
