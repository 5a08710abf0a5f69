/**
 * @file multilayer.hpp
 * @brief Thin-film multilayer coating model and its reflectance.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "rowlandoptics/coatings/refractive_index.hpp"
#include "rowlandoptics/core/types.hpp"
#include "rowlandoptics/surfaces/materials.hpp"

namespace rowlandoptics::coatings {

/**
 * @brief One film of a coating stack.
 *
 * `interface_width_nm` is the RMS width of the interface on top of this layer.
 */
struct Layer {
  std::string chemical{};
  double thickness_nm{};
  double interface_width_nm{};

  friend bool operator==(const Layer&, const Layer&) = default;
};

/**
 * @brief Mirror coated with an ordered stack of thin films on a substrate.
 *
 * `layers.front()` faces the incoming light. The substrate is treated as
 * semi-infinite; its thickness is carried for bookkeeping only.
 */
class MultilayerMirror final : public rowlandoptics::surfaces::IMaterial {
 public:
  struct Config {
    std::string name{"multilayer mirror"};
    std::vector<Layer> layers{};
    Layer substrate{};
  };

  /**
   * @brief Validate and build.
   *
   * Negative or non-finite thickness/interface width is a `RangeError`; an
   * unknown chemical is an `InputError`.
   */
  static rowlandoptics::core::BuildResult<MultilayerMirror> Create(const Config& config);

  [[nodiscard]] std::string name() const override { return config_.name; }

  [[nodiscard]] Eigen::ArrayXd efficiency(const rowlandoptics::surfaces::IncidentRays& rays,
                                          const rowlandoptics::core::Vec3& normal) const override;

  /**
   * @brief Unpolarized reflectance at one angle of incidence for every wavelength.
   */
  [[nodiscard]] Eigen::ArrayXd reflectance(const Eigen::ArrayXd& wavelength_nm, double incidence_rad) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  MultilayerMirror(Config config,
                   std::vector<std::shared_ptr<const IRefractiveIndex>> layer_index,
                   std::shared_ptr<const IRefractiveIndex> substrate_index)
      : config_(std::move(config)),
        layer_index_(std::move(layer_index)),
        substrate_index_(std::move(substrate_index)) {}

  Config config_{};
  std::vector<std::shared_ptr<const IRefractiveIndex>> layer_index_{};
  std::shared_ptr<const IRefractiveIndex> substrate_index_{};
};

}  // namespace rowlandoptics::coatings
