/**
 * @file detector.hpp
 * @brief Imaging sensor and camera on the Rowland circle.
 * @author Watosn
 */
#pragma once

#include <array>
#include <memory>
#include <string>
#include <utility>

#include "rowlandoptics/components/component.hpp"
#include "rowlandoptics/surfaces/materials.hpp"

namespace rowlandoptics::components {

/**
 * @brief Imaging sensor and its readout electronics.
 *
 * Only the pixel geometry, exposure time and material reach the surface; the
 * electronics fields are carried for detector simulation.
 */
class Detector final : public RowlandComponent {
 public:
  struct Config {
    std::string name{"detector"};
    std::string manufacturer{};
    std::string model_number{};
    std::string serial_number{};

    rowlandoptics::core::Vec2 width_pixel_um{};
    std::array<std::string, 2> axis_pixel{"detector_x", "detector_y"};
    std::array<int, 2> num_pixel{};
    /// Overscan columns per tap.
    int num_pixel_overscan{};
    /// Blank columns per tap.
    int num_pixel_blank{};

    /// Light-sensitive material of the sensor.
    std::shared_ptr<const rowlandoptics::surfaces::IMaterial> material{};

    double rowland_radius_mm{};
    double rowland_azimuth_rad{};
    rowlandoptics::core::Pose pose{};

    double temperature_k{};
    double gain_electrons_per_dn{};
    double readout_noise_dn{};
    double dark_current_electrons_per_s{};
    /// Standard deviation of the charge diffusion kernel.
    double charge_diffusion_um{};

    double timedelta_transfer_s{};
    double timedelta_readout_s{};
    double timedelta_exposure_s{};
    double timedelta_exposure_min_s{};
    double timedelta_exposure_max_s{};

    int bits_adc{};
  };

  /**
   * @brief Validate and build.
   *
   * Negative or non-finite physical quantities, negative pixel or bit counts,
   * a minimum exposure above the maximum, and an invalid Rowland anchor are a
   * `RangeError`.
   */
  static rowlandoptics::core::BuildResult<Detector> Create(const Config& config);

  /**
   * @brief Sensor surface: pixel geometry and material, no sag or apertures.
   */
  [[nodiscard]] rowlandoptics::surfaces::Surface surface() const override;

  /**
   * @brief Largest data number the ADC can report.
   */
  [[nodiscard]] double adc_full_scale_dn() const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit Detector(Config config);

  Config config_{};
};

}  // namespace rowlandoptics::components
