/**
 * @file materials.cpp
 * @brief Simple material implementations.
 * @author Watosn
 */

#include "rowlandoptics/surfaces/materials.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rowlandoptics::surfaces {

double incidence_angle_rad(const core::Vec3& direction, const core::Vec3& normal) {
  const double nd = core::norm(direction);
  const double nn = core::norm(normal);
  if (!(nd > 0.0) || !(nn > 0.0)) {
    return 0.0;
  }
  const double c = std::clamp(std::abs(core::dot(direction, normal)) / (nd * nn), 0.0, 1.0);
  return std::acos(c);
}

IncidentRays rays_at_incidence(const Eigen::ArrayXd& wavelength_nm, double incidence_rad) {
  return IncidentRays{
      .wavelength_nm = wavelength_nm,
      .direction = core::Vec3{std::sin(incidence_rad), 0.0, std::cos(incidence_rad)},
  };
}

Eigen::ArrayXd Mirror::efficiency(const IncidentRays& rays, const core::Vec3& /*normal*/) const {
  return Eigen::ArrayXd::Ones(rays.wavelength_nm.size());
}

core::BuildResult<SensorMaterial> SensorMaterial::Create(const Config& config) {
  if (!std::isfinite(config.quantum_efficiency) || config.quantum_efficiency < 0.0 || config.quantum_efficiency > 1.0) {
    return {.status = core::Status::RangeError};
  }
  return {.value = std::unique_ptr<SensorMaterial>(new SensorMaterial(config))};
}

Eigen::ArrayXd SensorMaterial::efficiency(const IncidentRays& rays, const core::Vec3& /*normal*/) const {
  return Eigen::ArrayXd::Constant(rays.wavelength_nm.size(), config_.quantum_efficiency);
}

}  // namespace rowlandoptics::surfaces
