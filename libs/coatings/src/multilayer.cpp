/**
 * @file multilayer.cpp
 * @brief Parratt recursion with Nevot-Croce interface roughness.
 * @author Watosn
 */

#include "rowlandoptics/coatings/multilayer.hpp"

#include <cmath>
#include <complex>
#include <utility>

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::coatings {
namespace {

using Complex = std::complex<double>;

bool valid_layer(const Layer& layer) {
  return core::is_non_negative(layer.thickness_nm) && core::is_non_negative(layer.interface_width_nm);
}

/**
 * @brief Amplitude reflection of the stack for one polarization.
 *
 * `n[j]` and `kz[j]` run from the ambient (j = 0) to the substrate (j = N + 1);
 * `d_nm[j]` and `sigma_nm[j]` belong to medium j.
 */
Eigen::ArrayXcd parratt(const std::vector<Eigen::ArrayXcd>& n,
                        const std::vector<Eigen::ArrayXcd>& kz,
                        const std::vector<double>& d_nm,
                        const std::vector<double>& sigma_nm,
                        bool p_polarized) {
  const std::size_t last = kz.size() - 1;
  Eigen::ArrayXcd r_below = Eigen::ArrayXcd::Zero(kz.front().size());
  for (std::size_t jj = last; jj > 0; --jj) {
    const std::size_t j = jj - 1;
    Eigen::ArrayXcd r{};
    if (p_polarized) {
      const Eigen::ArrayXcd a = n[j + 1].square() * kz[j];
      const Eigen::ArrayXcd b = n[j].square() * kz[j + 1];
      r = (a - b) / (a + b);
    } else {
      r = (kz[j] - kz[j + 1]) / (kz[j] + kz[j + 1]);
    }
    const double s2 = sigma_nm[j + 1] * sigma_nm[j + 1];
    if (s2 > 0.0) {
      r *= (Complex{-2.0 * s2, 0.0} * kz[j] * kz[j + 1]).exp();
    }
    if (j + 1 == last) {
      r_below = r;
      continue;
    }
    const Eigen::ArrayXcd phase = (Complex{0.0, 2.0 * d_nm[j + 1]} * kz[j + 1]).exp();
    const Eigen::ArrayXcd rp = r_below * phase;
    r_below = (r + rp) / (Complex{1.0, 0.0} + r * rp);
  }
  return r_below;
}

}  // namespace

core::BuildResult<MultilayerMirror> MultilayerMirror::Create(const Config& config) {
  for (const auto& layer : config.layers) {
    if (!valid_layer(layer)) {
      return {.status = core::Status::RangeError};
    }
  }
  if (!valid_layer(config.substrate)) {
    return {.status = core::Status::RangeError};
  }

  std::vector<std::shared_ptr<const IRefractiveIndex>> layer_index;
  layer_index.reserve(config.layers.size());
  for (const auto& layer : config.layers) {
    auto idx = index_for_chemical(layer.chemical);
    if (!idx) {
      return {.status = core::Status::InputError};
    }
    layer_index.push_back(std::move(idx));
  }
  auto substrate_index = index_for_chemical(config.substrate.chemical);
  if (!substrate_index) {
    return {.status = core::Status::InputError};
  }
  return {.value = std::unique_ptr<MultilayerMirror>(
              new MultilayerMirror(config, std::move(layer_index), std::move(substrate_index)))};
}

Eigen::ArrayXd MultilayerMirror::efficiency(const surfaces::IncidentRays& rays, const core::Vec3& normal) const {
  return reflectance(rays.wavelength_nm, surfaces::incidence_angle_rad(rays.direction, normal));
}

Eigen::ArrayXd MultilayerMirror::reflectance(const Eigen::ArrayXd& wavelength_nm, double incidence_rad) const {
  const auto size = wavelength_nm.size();
  const std::size_t media = config_.layers.size() + 2;

  std::vector<Eigen::ArrayXcd> n;
  std::vector<double> d_nm;
  std::vector<double> sigma_nm;
  n.reserve(media);
  d_nm.reserve(media);
  sigma_nm.reserve(media);

  n.push_back(Eigen::ArrayXcd::Constant(size, Complex{1.0, 0.0}));
  d_nm.push_back(0.0);
  sigma_nm.push_back(0.0);
  for (std::size_t i = 0; i < config_.layers.size(); ++i) {
    n.push_back(layer_index_[i]->index(wavelength_nm));
    d_nm.push_back(config_.layers[i].thickness_nm);
    sigma_nm.push_back(config_.layers[i].interface_width_nm);
  }
  n.push_back(substrate_index_->index(wavelength_nm));
  d_nm.push_back(0.0);
  sigma_nm.push_back(config_.substrate.interface_width_nm);

  // Tangential wavevector is conserved: kz_j = k0 sqrt(n_j^2 - sin^2(theta)).
  const Eigen::ArrayXcd k0 = (2.0 * core::constants::kPi / wavelength_nm).cast<Complex>();
  const double sin_theta = std::sin(incidence_rad);
  const Complex sin2{sin_theta * sin_theta, 0.0};
  std::vector<Eigen::ArrayXcd> kz;
  kz.reserve(media);
  for (const auto& nj : n) {
    kz.push_back(k0 * (nj.square() - sin2).sqrt());
  }

  const Eigen::ArrayXd rs = parratt(n, kz, d_nm, sigma_nm, false).abs2();
  const Eigen::ArrayXd rp = parratt(n, kz, d_nm, sigma_nm, true).abs2();
  return 0.5 * (rs + rp);
}

}  // namespace rowlandoptics::coatings
