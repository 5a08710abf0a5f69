/**
 * @file refractive_index.cpp
 * @brief Refractive-index models and the chemical catalogue.
 * @author Watosn
 */

#include "rowlandoptics/coatings/refractive_index.hpp"

#include "rowlandoptics/core/constants.hpp"

namespace rowlandoptics::coatings {
namespace {

using Complex = std::complex<double>;

// Dodge (1984), MgF2 ordinary ray.
constexpr SellmeierIndex::Config kMgF2Ordinary{
    .b = {0.48755108, 0.39875031, 2.3120353},
    .c_um2 = {0.04338408 * 0.04338408, 0.09461442 * 0.09461442, 23.793604 * 23.793604},
};

// Malitson (1965), fused silica.
constexpr SellmeierIndex::Config kFusedSilica{
    .b = {0.6961663, 0.4079426, 0.8974794},
    .c_um2 = {0.0684043 * 0.0684043, 0.1162414 * 0.1162414, 9.896161 * 9.896161},
};

// Free-electron aluminium.
constexpr DrudeIndex::Config kAluminium{
    .plasma_energy_ev = 14.98,
    .damping_energy_ev = 0.13,
    .epsilon_inf = 1.0,
};

}  // namespace

Eigen::ArrayXcd ConstantIndex::index(const Eigen::ArrayXd& wavelength_nm) const {
  return Eigen::ArrayXcd::Constant(wavelength_nm.size(), n_);
}

Eigen::ArrayXcd SellmeierIndex::index(const Eigen::ArrayXd& wavelength_nm) const {
  const Eigen::ArrayXd l2 = (wavelength_nm / core::constants::kNmPerUm).square();
  Eigen::ArrayXd n2 = Eigen::ArrayXd::Ones(wavelength_nm.size());
  for (std::size_t i = 0; i < config_.b.size(); ++i) {
    n2 += config_.b[i] * l2 / (l2 - config_.c_um2[i]);
  }
  return n2.cast<Complex>().sqrt();
}

Eigen::ArrayXcd DrudeIndex::index(const Eigen::ArrayXd& wavelength_nm) const {
  const Eigen::ArrayXcd energy_ev = (core::constants::kHcEvNm / wavelength_nm).cast<Complex>();
  const Complex ep2{config_.plasma_energy_ev * config_.plasma_energy_ev, 0.0};
  const Eigen::ArrayXcd denom = energy_ev.square() + Complex{0.0, config_.damping_energy_ev} * energy_ev;
  const Eigen::ArrayXcd eps = Complex{config_.epsilon_inf, 0.0} - ep2 / denom;
  return eps.sqrt();
}

std::shared_ptr<const IRefractiveIndex> index_for_chemical(std::string_view chemical) {
  if (chemical == "vacuum") {
    return std::make_shared<ConstantIndex>(Complex{1.0, 0.0});
  }
  if (chemical == "MgF2") {
    return std::make_shared<SellmeierIndex>(kMgF2Ordinary);
  }
  if (chemical == "SiO2") {
    return std::make_shared<SellmeierIndex>(kFusedSilica);
  }
  if (chemical == "Al") {
    return std::make_shared<DrudeIndex>(kAluminium);
  }
  return nullptr;
}

}  // namespace rowlandoptics::coatings
