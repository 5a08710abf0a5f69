/**
 * @file rulings.cpp
 * @brief Groove model implementation.
 * @author Watosn
 */

#include "rowlandoptics/surfaces/rulings.hpp"

#include <cmath>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::surfaces {

core::BuildResult<ConstantRulings> ConstantRulings::Create(const Config& config) {
  if (!std::isfinite(config.spacing_um) || config.spacing_um <= 0.0) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<ConstantRulings>(new ConstantRulings(config))};
}

double ConstantRulings::spacing_um(double /*x_mm*/) const { return config_.spacing_um; }

double ConstantRulings::groove_density_per_mm() const { return 1.0 / (config_.spacing_um * core::constants::kMmPerUm); }

DiffractionResult diffraction_angle(const IRulings& rulings, double wavelength_nm, double incidence_rad, double x_mm) {
  if (!(wavelength_nm > 0.0) || !std::isfinite(incidence_rad)) {
    return DiffractionResult{.status = core::Status::InputError};
  }
  const double d_nm = rulings.spacing_um(x_mm) * core::constants::kNmPerUm;
  const double s = static_cast<double>(rulings.diffraction_order()) * wavelength_nm / d_nm - std::sin(incidence_rad);
  if (!(std::abs(s) <= 1.0)) {
    return DiffractionResult{.status = core::Status::InputError};
  }
  return DiffractionResult{.angle_rad = std::asin(s)};
}

}  // namespace rowlandoptics::surfaces
