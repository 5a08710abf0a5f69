/**
 * @file refractive_index.hpp
 * @brief Complex refractive-index models of coating and substrate materials.
 * @author Watosn
 */
#pragma once

#include <array>
#include <complex>
#include <memory>
#include <string>
#include <string_view>

#include <Eigen/Dense>

namespace rowlandoptics::coatings {

/**
 * @brief Interface for dispersive optical constants n + i k.
 */
class IRefractiveIndex {
 public:
  virtual ~IRefractiveIndex() = default;
  /**
   * @brief Evaluate the complex index at each wavelength.
   * @param wavelength_nm Vacuum wavelengths.
   * @return One complex index per wavelength (k >= 0 is absorbing).
   */
  [[nodiscard]] virtual Eigen::ArrayXcd index(const Eigen::ArrayXd& wavelength_nm) const = 0;
};

/**
 * @brief Non-dispersive medium.
 */
class ConstantIndex final : public IRefractiveIndex {
 public:
  explicit ConstantIndex(std::complex<double> n) : n_(n) {}
  [[nodiscard]] Eigen::ArrayXcd index(const Eigen::ArrayXd& wavelength_nm) const override;

 private:
  std::complex<double> n_{1.0, 0.0};
};

/**
 * @brief Three-term Sellmeier dispersion, n^2 = 1 + sum B_i L^2 / (L^2 - C_i), L in um.
 */
class SellmeierIndex final : public IRefractiveIndex {
 public:
  struct Config {
    std::array<double, 3> b{};
    std::array<double, 3> c_um2{};
  };

  explicit SellmeierIndex(const Config& config) : config_(config) {}
  [[nodiscard]] Eigen::ArrayXcd index(const Eigen::ArrayXd& wavelength_nm) const override;

 private:
  Config config_{};
};

/**
 * @brief Free-electron metal, eps = eps_inf - Ep^2 / (E^2 + i G E).
 */
class DrudeIndex final : public IRefractiveIndex {
 public:
  struct Config {
    double plasma_energy_ev{};
    double damping_energy_ev{};
    double epsilon_inf{1.0};
  };

  explicit DrudeIndex(const Config& config) : config_(config) {}
  [[nodiscard]] Eigen::ArrayXcd index(const Eigen::ArrayXd& wavelength_nm) const override;

 private:
  Config config_{};
};

/**
 * @brief Shared index model for a chemical formula.
 *
 * Known formulas: "vacuum", "MgF2" (ordinary ray), "SiO2" (fused silica),
 * "Al". Returns null for anything else.
 */
[[nodiscard]] std::shared_ptr<const IRefractiveIndex> index_for_chemical(std::string_view chemical);

}  // namespace rowlandoptics::coatings
