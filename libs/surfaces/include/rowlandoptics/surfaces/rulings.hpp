/**
 * @file rulings.hpp
 * @brief Diffraction-grating groove models.
 * @author Watosn
 */
#pragma once

#include "rowlandoptics/core/types.hpp"

namespace rowlandoptics::surfaces {

/**
 * @brief Outgoing diffraction angle and status.
 */
struct DiffractionResult {
  double angle_rad{};
  rowlandoptics::core::Status status{rowlandoptics::core::Status::Ok};
};

/**
 * @brief Interface for groove spacing/profile models.
 */
class IRulings {
 public:
  virtual ~IRulings() = default;
  /**
   * @brief Groove spacing at local grating coordinate x.
   */
  [[nodiscard]] virtual double spacing_um(double x_mm) const = 0;
  /**
   * @brief Diffraction order the grating is used in.
   */
  [[nodiscard]] virtual int diffraction_order() const = 0;
};

/**
 * @brief Uniformly ruled grating.
 */
class ConstantRulings final : public IRulings {
 public:
  struct Config {
    double spacing_um{};
    int diffraction_order{1};
  };

  /**
   * @brief Validate and build; a non-positive spacing is a `RangeError`.
   */
  static rowlandoptics::core::BuildResult<ConstantRulings> Create(const Config& config);

  [[nodiscard]] double spacing_um(double x_mm) const override;
  [[nodiscard]] int diffraction_order() const override { return config_.diffraction_order; }

  /**
   * @brief Grooves per millimetre.
   */
  [[nodiscard]] double groove_density_per_mm() const;

 private:
  explicit ConstantRulings(Config config) : config_(config) {}

  Config config_{};
};

/**
 * @brief Solve the grating equation sin(beta) = m * lambda / d - sin(alpha).
 *
 * Angles are measured from the grating normal at local coordinate x. An
 * evanescent order (|sin(beta)| > 1) or a non-positive wavelength is an
 * `InputError`.
 */
[[nodiscard]] DiffractionResult diffraction_angle(const IRulings& rulings,
                                                  double wavelength_nm,
                                                  double incidence_rad,
                                                  double x_mm = 0.0);

}  // namespace rowlandoptics::surfaces
