/**
 * @file coating_fit.cpp
 * @brief Levenberg-Marquardt coating calibration.
 * @author Watosn
 */

#include "rowlandoptics/coatings/coating_fit.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <Eigen/Dense>
#include <unsupported/Eigen/NonLinearOptimization>
#include <unsupported/Eigen/NumericalDiff>

namespace rowlandoptics::coatings {
namespace {

constexpr int kNumParameters = 3;

/**
 * @brief Residual functor in the form expected by Eigen::NumericalDiff.
 *
 * Internal parameters map to physical ones through max(x, 0), which keeps
 * every model evaluation inside the non-negative bounds.
 */
struct ReflectanceResidual {
  using Scalar = double;
  enum { InputsAtCompileTime = Eigen::Dynamic, ValuesAtCompileTime = Eigen::Dynamic };
  using InputType = Eigen::VectorXd;
  using ValueType = Eigen::VectorXd;
  using JacobianType = Eigen::MatrixXd;

  const MultilayerMirror* design{nullptr};
  const ReflectanceMeasurement* measurement{nullptr};

  int operator()(const InputType& x, ValueType& fvec) const {
    const auto trial = with_fit_parameters(*design, std::max(x[0], 0.0), std::max(x[1], 0.0), std::max(x[2], 0.0));
    if (trial.status != core::Status::Ok) {
      return -1;
    }
    fvec = (trial.value->reflectance(measurement->wavelength_nm, measurement->incidence_rad) - measurement->reflectance)
               .matrix();
    if (!fvec.allFinite()) {
      return -1;
    }
    return 0;
  }

  [[nodiscard]] int inputs() const { return kNumParameters; }
  [[nodiscard]] int values() const { return static_cast<int>(measurement->wavelength_nm.size()); }
};

bool converged(Eigen::LevenbergMarquardtSpace::Status s) {
  switch (s) {
    case Eigen::LevenbergMarquardtSpace::RelativeReductionTooSmall:
    case Eigen::LevenbergMarquardtSpace::RelativeErrorTooSmall:
    case Eigen::LevenbergMarquardtSpace::RelativeErrorAndReductionTooSmall:
    case Eigen::LevenbergMarquardtSpace::CosinusTooSmall:
      return true;
    default:
      return false;
  }
}

}  // namespace

double rms_residual(const MultilayerMirror& coating, const ReflectanceMeasurement& measurement) {
  const Eigen::ArrayXd model = coating.reflectance(measurement.wavelength_nm, measurement.incidence_rad);
  return std::sqrt((model - measurement.reflectance).square().mean());
}

core::BuildResult<MultilayerMirror> with_fit_parameters(const MultilayerMirror& design,
                                                        double thickness_layer0_nm,
                                                        double thickness_layer1_nm,
                                                        double interface_width_nm) {
  auto config = design.config();
  if (config.layers.size() < 2) {
    return {.status = core::Status::InputError};
  }
  config.layers[0].thickness_nm = thickness_layer0_nm;
  config.layers[1].thickness_nm = thickness_layer1_nm;
  for (auto& layer : config.layers) {
    layer.interface_width_nm = interface_width_nm;
  }
  config.substrate.interface_width_nm = interface_width_nm;
  return MultilayerMirror::Create(config);
}

CoatingFitResult fit_coating(const MultilayerMirror& design,
                             const ReflectanceMeasurement& measurement,
                             const CoatingFitConfig& config) {
  if (validate_measurement(measurement) != core::Status::Ok) {
    return CoatingFitResult{.status = core::Status::InputError};
  }
  if (measurement.wavelength_nm.size() < kNumParameters || design.config().layers.size() < 2) {
    return CoatingFitResult{.status = core::Status::InputError};
  }

  const auto& layers = design.config().layers;
  const double sigma0 = config.interface_width_guess_nm.value_or(layers[0].interface_width_nm);
  const auto start = with_fit_parameters(design, layers[0].thickness_nm, layers[1].thickness_nm, sigma0);
  if (start.status != core::Status::Ok) {
    return CoatingFitResult{.status = start.status};
  }

  Eigen::VectorXd x(kNumParameters);
  x << layers[0].thickness_nm, layers[1].thickness_nm, sigma0;

  Eigen::NumericalDiff<ReflectanceResidual> functor(ReflectanceResidual{.design = &design, .measurement = &measurement});
  Eigen::LevenbergMarquardt<Eigen::NumericalDiff<ReflectanceResidual>> lm(functor);
  lm.parameters.maxfev = config.max_function_evaluations;
  const auto info = lm.minimize(x);

  CoatingFitResult out{
      .rms_initial = rms_residual(*start.value, measurement),
      .iterations = static_cast<int>(lm.iter),
      .function_evaluations = static_cast<int>(lm.nfev),
      .optimizer_code = static_cast<int>(info),
  };
  if (!converged(info) || !std::isfinite(lm.fnorm)) {
    out.status = core::Status::OptimizationError;
    return out;
  }

  out.thickness_layer0_nm = std::max(x[0], 0.0);
  out.thickness_layer1_nm = std::max(x[1], 0.0);
  out.interface_width_nm = std::max(x[2], 0.0);
  auto fitted = with_fit_parameters(design, out.thickness_layer0_nm, out.thickness_layer1_nm, out.interface_width_nm);
  if (fitted.status != core::Status::Ok) {
    out.status = fitted.status;
    return out;
  }
  out.rms_final = rms_residual(*fitted.value, measurement);
  if (!std::isfinite(out.rms_final)) {
    out.status = core::Status::OptimizationError;
    return out;
  }
  out.coating = std::move(fitted.value);
  return out;
}

}  // namespace rowlandoptics::coatings
