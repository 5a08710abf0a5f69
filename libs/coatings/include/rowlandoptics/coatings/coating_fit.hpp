/**
 * @file coating_fit.hpp
 * @brief Calibration of a multilayer coating against measured reflectance.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <optional>

#include "rowlandoptics/coatings/measurement.hpp"
#include "rowlandoptics/coatings/multilayer.hpp"
#include "rowlandoptics/core/types.hpp"

namespace rowlandoptics::coatings {

/**
 * @brief Options for the coating fit.
 */
struct CoatingFitConfig {
  // Starting interface width; defaults to the template's first layer.
  std::optional<double> interface_width_guess_nm{};
  int max_function_evaluations{400};
};

/**
 * @brief Output bundle for a coating fit.
 */
struct CoatingFitResult {
  std::shared_ptr<const MultilayerMirror> coating{};
  double thickness_layer0_nm{};
  double thickness_layer1_nm{};
  double interface_width_nm{};
  double rms_initial{};
  double rms_final{};
  int iterations{};
  int function_evaluations{};
  int optimizer_code{};
  rowlandoptics::core::Status status{rowlandoptics::core::Status::Ok};
};

/**
 * @brief Root-mean-square difference between a coating's reflectance and a measurement.
 */
[[nodiscard]] double rms_residual(const MultilayerMirror& coating, const ReflectanceMeasurement& measurement);

/**
 * @brief Copy of `design` with new thicknesses for layers 0 and 1 and one interface width for every layer.
 *
 * Chemistry, layer order and the substrate thickness are kept.
 */
[[nodiscard]] rowlandoptics::core::BuildResult<MultilayerMirror> with_fit_parameters(const MultilayerMirror& design,
                                                                                     double thickness_layer0_nm,
                                                                                     double thickness_layer1_nm,
                                                                                     double interface_width_nm);

/**
 * @brief Fit layer-0/layer-1 thickness and a common interface width to a measurement.
 *
 * Bounded Levenberg-Marquardt least squares (all parameters >= 0) started
 * from the template values. The measurement is evaluated at its own angle of
 * incidence over all wavelengths at once.
 *
 * Status: `InputError` for an invalid or empty measurement, fewer than three
 * points, or a template with fewer than two layers; `OptimizationError` when
 * the optimizer terminates without converging.
 */
[[nodiscard]] CoatingFitResult fit_coating(const MultilayerMirror& design,
                                           const ReflectanceMeasurement& measurement,
                                           const CoatingFitConfig& config = {});

}  // namespace rowlandoptics::coatings
