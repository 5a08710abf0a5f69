/**
 * @file materials.hpp
 * @brief Material interface carried by optical surfaces.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>

#include <Eigen/Dense>

#include "rowlandoptics/core/types.hpp"

namespace rowlandoptics::surfaces {

/**
 * @brief Batch of rays sharing a propagation direction.
 *
 * Every material evaluation broadcasts over `wavelength_nm`.
 */
struct IncidentRays {
  Eigen::ArrayXd wavelength_nm{};
  rowlandoptics::core::Vec3 direction{0.0, 0.0, 1.0};
};

/**
 * @brief Interface for surface materials (coatings, mirrors, sensor layers).
 */
class IMaterial {
 public:
  virtual ~IMaterial() = default;
  /**
   * @brief Human-readable material name.
   */
  [[nodiscard]] virtual std::string name() const = 0;
  /**
   * @brief Fraction of incident power reflected (or detected, for sensors).
   * @param rays Incident rays; one output per wavelength.
   * @param normal Surface normal in the same frame as `rays.direction`.
   */
  [[nodiscard]] virtual Eigen::ArrayXd efficiency(const IncidentRays& rays,
                                                  const rowlandoptics::core::Vec3& normal) const = 0;
};

/**
 * @brief Angle between a ray direction and a surface normal, folded into [0, pi/2].
 */
[[nodiscard]] double incidence_angle_rad(const rowlandoptics::core::Vec3& direction,
                                         const rowlandoptics::core::Vec3& normal);

/**
 * @brief Rays at a fixed angle of incidence onto a surface with normal -z.
 */
[[nodiscard]] IncidentRays rays_at_incidence(const Eigen::ArrayXd& wavelength_nm, double incidence_rad);

/**
 * @brief Ideal reflector.
 */
class Mirror final : public IMaterial {
 public:
  [[nodiscard]] std::string name() const override { return "mirror"; }
  [[nodiscard]] Eigen::ArrayXd efficiency(const IncidentRays& rays,
                                          const rowlandoptics::core::Vec3& normal) const override;
};

/**
 * @brief Light-sensitive layer of an imaging sensor with flat quantum efficiency.
 */
class SensorMaterial final : public IMaterial {
 public:
  struct Config {
    std::string name{"silicon"};
    double quantum_efficiency{1.0};
  };

  /**
   * @brief Validate and build; efficiency outside [0, 1] is a `RangeError`.
   */
  static rowlandoptics::core::BuildResult<SensorMaterial> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return config_.name; }
  [[nodiscard]] Eigen::ArrayXd efficiency(const IncidentRays& rays,
                                          const rowlandoptics::core::Vec3& normal) const override;

 private:
  explicit SensorMaterial(Config config) : config_(std::move(config)) {}

  Config config_{};
};

}  // namespace rowlandoptics::surfaces
